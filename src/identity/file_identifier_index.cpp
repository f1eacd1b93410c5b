#include "archivist/identity/file_identifier_index.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>

#include "archivist/core/ids.h"

namespace archivist::identity {

FileIdentifierIndex::FileIdentifierIndex(std::string path) : path_(std::move(path)) {
    const auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
}

core::Result<std::string> FileIdentifierIndex::GetOrCreate(const std::string& logical_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto mapping = Load();
    if (!mapping.ok()) {
        return mapping.error();
    }
    auto it = mapping.value().find(logical_path);
    if (it != mapping.value().end()) {
        return it->second;
    }

    const auto id = core::GenerateArchiveId();
    mapping.value()[logical_path] = id;
    // Persist before the id is ever handed out.
    auto saved = Save(mapping.value());
    if (!saved.ok()) {
        return saved.error();
    }
    return id;
}

core::Result<std::string> FileIdentifierIndex::Lookup(const std::string& logical_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto mapping = Load();
    if (!mapping.ok()) {
        return mapping.error();
    }
    auto it = mapping.value().find(logical_path);
    if (it == mapping.value().end()) {
        return core::Error{core::ErrorCode::kNotFound, "no id for " + logical_path};
    }
    return it->second;
}

core::Result<std::string> FileIdentifierIndex::ResolveId(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto mapping = Load();
    if (!mapping.ok()) {
        return mapping.error();
    }
    for (const auto& entry : mapping.value()) {
        if (entry.second == id) {
            return entry.first;
        }
    }
    return core::Error{core::ErrorCode::kNotFound, "unknown archive id"};
}

core::Result<void> FileIdentifierIndex::Migrate(const std::string& old_path,
                                                const std::string& new_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto mapping = Load();
    if (!mapping.ok()) {
        return mapping.error();
    }
    auto it = mapping.value().find(old_path);
    if (it == mapping.value().end()) {
        return core::Ok();
    }
    const auto id = it->second;
    mapping.value().erase(it);
    mapping.value()[new_path] = id;
    return Save(mapping.value());
}

core::Result<void> FileIdentifierIndex::Remove(const std::string& logical_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto mapping = Load();
    if (!mapping.ok()) {
        return mapping.error();
    }
    if (mapping.value().erase(logical_path) == 0) {
        return core::Ok();
    }
    return Save(mapping.value());
}

core::Result<FileIdentifierIndex::Mapping> FileIdentifierIndex::Load() const {
    Mapping mapping;
    std::ifstream in(path_, std::ios::binary);
    if (!in.is_open()) {
        // No file yet: nothing has been assigned.
        return mapping;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    if (ss.str().empty()) {
        return mapping;
    }
    try {
        Poco::JSON::Parser parser;
        auto obj = parser.parse(ss.str()).extract<Poco::JSON::Object::Ptr>();
        for (auto it = obj->begin(); it != obj->end(); ++it) {
            mapping[it->first] = it->second.convert<std::string>();
        }
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kIoError,
                           "identifier index " + path_ + " is unreadable: " + ex.displayText()};
    }
    return mapping;
}

core::Result<void> FileIdentifierIndex::Save(const Mapping& mapping) const {
    Poco::JSON::Object obj;
    for (const auto& entry : mapping) {
        obj.set(entry.first, entry.second);
    }

    const auto temp_path = path_ + ".tmp";
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return core::Error{core::ErrorCode::kIoError, "failed to write identifier index"};
        }
        obj.stringify(out, 2);
        out.flush();
        if (!out) {
            return core::Error{core::ErrorCode::kIoError, "failed to write identifier index"};
        }
    }
    std::error_code ec;
    std::filesystem::rename(temp_path, path_, ec);
    if (ec) {
        std::filesystem::remove(temp_path, ec);
        return core::Error{core::ErrorCode::kIoError, "failed to replace identifier index"};
    }
    return core::Ok();
}

}  // namespace archivist::identity
