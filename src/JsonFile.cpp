#include "JsonFile.hpp"
#include <fstream>
#include <system_error>

std::expected<YAML::Node, std::string> read_json_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return std::unexpected("File missing: " + path.string());
    }
    try {
        return YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        return std::unexpected(std::string(e.what()));
    }
}

void configure_json_emitter(YAML::Emitter& out) {
    out.SetOutputCharset(YAML::EscapeAsJson);
    out.SetMapFormat(YAML::Flow);
    out.SetSeqFormat(YAML::Flow);
    out.SetNullFormat(YAML::LowerNull);
}

void emit_json_value(YAML::Emitter& out, const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Map:
            out << YAML::BeginMap;
            for (const auto& kv : node) {
                out << YAML::Key << YAML::DoubleQuoted << kv.first.as<std::string>();
                out << YAML::Value;
                emit_json_value(out, kv.second);
            }
            out << YAML::EndMap;
            break;
        case YAML::NodeType::Sequence:
            out << YAML::BeginSeq;
            for (const auto& item : node) {
                emit_json_value(out, item);
            }
            out << YAML::EndSeq;
            break;
        case YAML::NodeType::Scalar:
            // "!" marks a quoted scalar in the source document
            if (node.Tag() == "!") {
                out << YAML::DoubleQuoted << node.Scalar();
            } else {
                out << node.Scalar();
            }
            break;
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            out << YAML::Null;
            break;
    }
}

std::expected<void, std::string> write_text_file(const std::filesystem::path& path, std::string_view text) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected("Cannot create directory " + path.parent_path().string() + ": " + ec.message());
        }
    }
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return std::unexpected("Cannot open " + path.string() + " for writing");
    }
    file.write(text.data(), static_cast<std::streamsize>(text.size()));
    file << '\n';
    if (!file) {
        return std::unexpected("Write failed: " + path.string());
    }
    return {};
}
