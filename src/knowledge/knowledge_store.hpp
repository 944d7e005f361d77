#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "utils/logging.hpp"

namespace minigpt::knowledge {

inline constexpr const char* kFallbackResponse = "Sorry, I don't understand that.";
inline constexpr const char* kDefaultKnowledgeFile = "knowledge_base.json";

enum class LoadResult {
    kLoaded,
    kNotFound,
    kMalformed,
    kUnreadable
};

const char* ToString(LoadResult result);

struct KnowledgeEntry {
    std::string key;
    std::string response;
};

// Exact-match mapping from canonical key to response text, persisted as a
// JSON object of strings. Memory is authoritative; the file only reflects it
// as of the last Load or Save. Failures are reported through the logger and
// never thrown. No cross-process locking: two processes saving the same file
// race, last writer wins.
class KnowledgeStore {
public:
    KnowledgeStore(std::string backing_path, minigpt::utils::Logger& logger);

    std::string Lookup(const std::string& key) const;
    void Add(const std::string& key, const std::string& response);

    // Merges the file into memory. Loaded keys overwrite existing ones, other
    // keys are kept. Anything but success leaves memory untouched.
    LoadResult Load();
    LoadResult Load(const std::string& path);

    bool Save() const;
    bool Save(const std::string& path) const;

    // Sorted by key.
    std::vector<KnowledgeEntry> All() const;

    bool Contains(const std::string& key) const;
    std::size_t Size() const { return responses_.size(); }
    const std::string& BackingPath() const { return backing_path_; }

private:
    std::string backing_path_;
    minigpt::utils::Logger& logger_;
    std::map<std::string, std::string> responses_;
};

}  // namespace minigpt::knowledge
