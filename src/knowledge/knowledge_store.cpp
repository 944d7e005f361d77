#include "knowledge/knowledge_store.hpp"

#include <filesystem>
#include <system_error>
#include <fstream>
#include <utility>

#include "nlohmann/json.hpp"

namespace minigpt::knowledge {
namespace {

constexpr const char* kTag = "knowledge";

}  // namespace

const char* ToString(LoadResult result) {
    switch (result) {
        case LoadResult::kLoaded: return "loaded";
        case LoadResult::kNotFound: return "not_found";
        case LoadResult::kMalformed: return "malformed";
        case LoadResult::kUnreadable: return "unreadable";
    }
    return "unknown";
}

KnowledgeStore::KnowledgeStore(std::string backing_path, minigpt::utils::Logger& logger)
    : backing_path_(std::move(backing_path))
    , logger_(logger) {}

std::string KnowledgeStore::Lookup(const std::string& key) const {
    auto it = responses_.find(key);
    if (it == responses_.end()) {
        return kFallbackResponse;
    }
    return it->second;
}

void KnowledgeStore::Add(const std::string& key, const std::string& response) {
    responses_.insert_or_assign(key, response);
}

bool KnowledgeStore::Contains(const std::string& key) const {
    return responses_.find(key) != responses_.end();
}

LoadResult KnowledgeStore::Load() {
    return Load(backing_path_);
}

LoadResult KnowledgeStore::Load(const std::string& path) {
    std::error_code ec;
    const auto status = std::filesystem::status(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        logger_.Error(kTag, "Cannot access knowledge file '" + path + "': " + ec.message());
        return LoadResult::kUnreadable;
    }
    if (!std::filesystem::exists(status)) {
        logger_.Warn(kTag, "Knowledge file '" + path + "' not found. Starting fresh.");
        return LoadResult::kNotFound;
    }
    if (std::filesystem::is_directory(status)) {
        logger_.Error(kTag, "Knowledge path '" + path + "' is a directory.");
        return LoadResult::kUnreadable;
    }

    std::ifstream input(path);
    if (!input.is_open()) {
        logger_.Error(kTag, "Failed to open knowledge file '" + path + "'.");
        return LoadResult::kUnreadable;
    }

    const auto data = nlohmann::json::parse(input, nullptr, false);
    if (data.is_discarded()) {
        logger_.Warn(kTag, "Error decoding JSON file '" + path + "'. Please check its format.");
        return LoadResult::kMalformed;
    }
    if (!data.is_object()) {
        logger_.Warn(kTag, "Knowledge file '" + path + "' must contain a JSON object.");
        return LoadResult::kMalformed;
    }

    std::map<std::string, std::string> loaded;
    for (const auto& item : data.items()) {
        if (!item.value().is_string()) {
            logger_.Warn(kTag, "Knowledge file '" + path + "' has a non-string value for key '"
                + item.key() + "'.");
            return LoadResult::kMalformed;
        }
        loaded.emplace(item.key(), item.value().get<std::string>());
    }

    for (auto& [key, response] : loaded) {
        responses_.insert_or_assign(key, std::move(response));
    }
    logger_.Info(kTag, "Knowledge base loaded from '" + path + "' ("
        + std::to_string(loaded.size()) + " entries).");
    return LoadResult::kLoaded;
}

bool KnowledgeStore::Save() const {
    return Save(backing_path_);
}

bool KnowledgeStore::Save(const std::string& path) const {
    nlohmann::json data = nlohmann::json::object();
    for (const auto& [key, response] : responses_) {
        data[key] = response;
    }

    // Serialize before opening so an encoding error cannot truncate the file.
    // Entries holding invalid UTF-8 are written with U+FFFD substituted.
    std::string text;
    try {
        text = data.dump(4);
    } catch (const nlohmann::json::type_error& ex) {
        logger_.Warn(kTag, std::string("Invalid UTF-8 in knowledge base, replacing bytes: ") + ex.what());
        text = data.dump(4, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    std::ofstream output(path, std::ios::trunc);
    if (!output.is_open()) {
        logger_.Error(kTag, "Error saving knowledge to '" + path + "'. Please try again.");
        return false;
    }
    output << text << '\n';
    output.flush();
    if (!output) {
        logger_.Error(kTag, "Error writing knowledge to '" + path + "'. Please try again.");
        return false;
    }
    logger_.Info(kTag, "Knowledge base saved to '" + path + "'.");
    return true;
}

std::vector<KnowledgeEntry> KnowledgeStore::All() const {
    std::vector<KnowledgeEntry> entries;
    entries.reserve(responses_.size());
    for (const auto& [key, response] : responses_) {
        entries.push_back(KnowledgeEntry{key, response});
    }
    return entries;
}

}  // namespace minigpt::knowledge
