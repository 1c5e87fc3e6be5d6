#include <algorithm>
#include <cctype>
#include <fstream>
#include <gigmap/logger.hpp>
#include <gigmap/store.hpp>
#include <sstream>
#include <stdexcept>

namespace gigmap
{

// ─── MemoryStore ────────────────────────────────────────────────────────────

void MemoryStore::put(const std::string& key, const std::string& value)
{
    std::lock_guard<std::mutex> lock(mu_);
    values_[key] = value;
}

std::optional<std::string> MemoryStore::get(const std::string& key) const
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = values_.find(key);
    if (it == values_.end())
        return std::nullopt;
    return it->second;
}

std::vector<std::string> MemoryStore::keys() const
{
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<std::string> out;
    out.reserve(values_.size());
    for (const auto& [key, value] : values_)
        out.push_back(key);
    return out;
}

size_t MemoryStore::size() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return values_.size();
}

// ─── DirectoryStore ─────────────────────────────────────────────────────────

DirectoryStore::DirectoryStore(std::filesystem::path root) : root_(std::move(root))
{
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec)
    {
        throw std::runtime_error("cannot create store directory " + root_.string() + ": "
                                 + ec.message());
    }
}

std::filesystem::path DirectoryStore::path_for(const std::string& key) const
{
    bool valid = !key.empty() && key != "." && key != "..";
    for (char c : key)
    {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.'))
            valid = false;
    }
    if (!valid)
        throw std::invalid_argument("invalid store key '" + key + "'");
    return root_ / key;
}

void DirectoryStore::put(const std::string& key, const std::string& value)
{
    const auto    path = path_for(key);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open())
        throw std::runtime_error("cannot open " + path.string() + " for writing");
    out << value;
    out.close();
    if (!out)
        throw std::runtime_error("failed writing " + path.string());
    GIGMAP_LOG_DEBUG("store", "Wrote {} bytes to {}", value.size(), path.string());
}

std::optional<std::string> DirectoryStore::get(const std::string& key) const
{
    const auto    path = path_for(key);
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
        return std::nullopt;
    std::ostringstream buf;
    buf << in.rdbuf();
    return buf.str();
}

std::vector<std::string> DirectoryStore::keys() const
{
    std::vector<std::string> out;
    for (const auto& entry : std::filesystem::directory_iterator(root_))
    {
        if (entry.is_regular_file())
            out.push_back(entry.path().filename().string());
    }
    std::sort(out.begin(), out.end());
    return out;
}

}   // namespace gigmap
