#pragma once

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

#include "google/protobuf/text_format.h"

namespace sentinel::proto {

// Reads a message stored either in the binary wire format or in the text format. Returns nullopt
// if the file is missing or holds neither.
template <typename MsgType>
std::optional<MsgType> load_from_file(const std::filesystem::path &path) {
    if (!std::filesystem::exists(path)) {
        std::cerr << "No proto file at: " << path << std::endl;
        return std::nullopt;
    }

    std::ifstream file_in(path, std::ios::binary | std::ios::in);
    std::stringstream sstream;
    sstream << file_in.rdbuf();

    MsgType out;

    // Try text first. The binary parser accepts some text files as messages full of unknown fields.
    if (google::protobuf::TextFormat::ParseFromString(sstream.str(), &out)) {
        return out;
    }

    out.Clear();
    if (out.ParseFromString(sstream.str())) {
        return out;
    }

    std::cerr << "Couldn't parse " << path << " as binary or text proto" << std::endl;
    return std::nullopt;
}

// Writes msg in the text format, replacing any existing file. Returns false if the file couldn't
// be written.
template <typename MsgType>
bool write_text_to_file(const MsgType &msg, const std::filesystem::path &path) {
    std::string text_proto;
    if (!google::protobuf::TextFormat::PrintToString(msg, &text_proto)) {
        return false;
    }
    std::ofstream file_out(path, std::ios::out | std::ios::trunc);
    file_out << text_proto;
    return static_cast<bool>(file_out);
}

}  // namespace sentinel::proto
