#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace gigmap
{

// String-keyed store of serialized results. Values are opaque text.
class KeyValueStore
{
   public:
    virtual ~KeyValueStore() = default;

    // Replaces any existing value.
    virtual void                       put(const std::string& key, const std::string& value) = 0;
    virtual std::optional<std::string> get(const std::string& key) const                     = 0;
    // Every key, sorted.
    virtual std::vector<std::string> keys() const = 0;

    bool contains(const std::string& key) const { return get(key).has_value(); }
};

// In-process store. Thread-safe: all public methods lock the internal mutex.
class MemoryStore : public KeyValueStore
{
   public:
    void                       put(const std::string& key, const std::string& value) override;
    std::optional<std::string> get(const std::string& key) const override;
    std::vector<std::string>   keys() const override;

    size_t size() const;

   private:
    mutable std::mutex                 mu_;
    std::map<std::string, std::string> values_;
};

// One file per key under a directory, created on construction. Keys may
// only use letters, digits, '_', '-' and '.'; anything else is a
// std::invalid_argument. Write failures throw std::runtime_error.
class DirectoryStore : public KeyValueStore
{
   public:
    explicit DirectoryStore(std::filesystem::path root);

    void                       put(const std::string& key, const std::string& value) override;
    std::optional<std::string> get(const std::string& key) const override;
    std::vector<std::string>   keys() const override;

    const std::filesystem::path& root() const { return root_; }

   private:
    std::filesystem::path path_for(const std::string& key) const;

    std::filesystem::path root_;
};

}   // namespace gigmap
