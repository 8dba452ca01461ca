#pragma once

#include "remote/Store.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <iterator>
#include <map>
#include <sstream>

namespace pfs::test {

using remote::model::Entry;

// In-memory store that records every call made against it.
class FakeStore final : public remote::Store {
public:
    struct Calls {
        int list = 0, get = 0, remove = 0, rename = 0, move = 0, createFolder = 0;
        int upload = 0, download = 0, accountInfo = 0, listTransfers = 0;

        [[nodiscard]] int total() const {
            return list + get + remove + rename + move + createFolder + upload + download + accountInfo + listTransfers;
        }
    };

    FakeStore() {
        Entry root;
        root.id = remote::model::ROOT_ID;
        root.name = "Your Files";
        root.is_directory = true;
        root.content_type = remote::model::DIRECTORY_CONTENT_TYPE;
        entries_[root.id] = root;
    }

    int64_t addFolder(const std::string& name, const int64_t parentId = remote::model::ROOT_ID) {
        Entry e;
        e.id = nextId_++;
        e.name = name;
        e.is_directory = true;
        e.parent_id = parentId;
        e.content_type = remote::model::DIRECTORY_CONTENT_TYPE;
        entries_[e.id] = e;
        return e.id;
    }

    int64_t addFile(const std::string& name, const std::string& content, const int64_t parentId = remote::model::ROOT_ID) {
        Entry e;
        e.id = nextId_++;
        e.name = name;
        e.size = static_cast<int64_t>(content.size());
        e.parent_id = parentId;
        e.created_at = 1468572817;
        e.content_type = "text/plain";
        entries_[e.id] = e;
        contents_[e.id] = content;
        return e.id;
    }

    [[nodiscard]] bool exists(const int64_t id) const { return entries_.contains(id); }
    [[nodiscard]] const Entry& entry(const int64_t id) const { return entries_.at(id); }
    [[nodiscard]] const std::string& content(const int64_t id) const { return contents_.at(id); }

    [[nodiscard]] std::optional<int64_t> idOf(const std::string& name, const int64_t parentId) const {
        for (const auto& [id, e] : entries_)
            if (id != remote::model::ROOT_ID && e.parent_id == parentId && e.name == name) return id;
        return std::nullopt;
    }

    void resetCalls() { calls = {}; downloadOffsets.clear(); }

    std::vector<Entry> list(const int64_t parentId) override {
        ++calls.list;
        if (failList) throw remote::RemoteError("list failed", 500);

        std::vector<Entry> out;
        for (const auto& [id, e] : entries_)
            if (id != remote::model::ROOT_ID && e.parent_id == parentId) out.push_back(e);
        return out;
    }

    Entry get(const int64_t id) override {
        ++calls.get;
        const auto it = entries_.find(id);
        if (it == entries_.end()) throw remote::RemoteError("no such file", 404);
        return it->second;
    }

    void remove(const int64_t id) override {
        ++calls.remove;
        if (!entries_.erase(id)) throw remote::RemoteError("no such file", 404);
        contents_.erase(id);
    }

    void rename(const int64_t id, const std::string& newName) override {
        ++calls.rename;
        entries_.at(id).name = newName;
    }

    void move(const int64_t newParentId, const int64_t id) override {
        ++calls.move;
        entries_.at(id).parent_id = newParentId;
    }

    Entry createFolder(const std::string& name, const int64_t parentId) override {
        ++calls.createFolder;
        return entries_.at(addFolder(name, parentId));
    }

    Entry upload(const std::filesystem::path& source, const std::string& name, const int64_t parentId) override {
        ++calls.upload;
        if (failUpload) throw remote::RemoteError("upload failed", 500);

        std::ifstream in(source, std::ios::binary);
        if (!in) throw remote::RemoteError("cannot open " + source.string());
        const std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        return entries_.at(addFile(name, data, parentId));
    }

    std::unique_ptr<remote::ByteStream> downloadRange(const int64_t id, const int64_t offset,
                                                      const std::optional<int64_t> length) override {
        ++calls.download;
        downloadOffsets.push_back(offset);

        const auto& data = contents_.at(id);
        const auto start = std::min<std::size_t>(static_cast<std::size_t>(offset), data.size());
        const auto count = length ? static_cast<std::size_t>(*length) : std::string::npos;
        return std::make_unique<StringStream>(data.substr(start, count), chunkSize);
    }

    remote::model::AccountInfo accountInfo() override {
        ++calls.accountInfo;
        if (failAccountInfo) throw remote::RemoteError("account unavailable", 503);
        return account;
    }

    std::vector<remote::model::Transfer> listTransfers() override {
        ++calls.listTransfers;
        return transfers;
    }

    Calls calls;
    std::vector<int64_t> downloadOffsets;
    remote::model::AccountInfo account;
    std::vector<remote::model::Transfer> transfers;

    bool failList = false;
    bool failUpload = false;
    bool failAccountInfo = false;

    // Bytes handed out per ByteStream::read, to exercise short reads.
    std::size_t chunkSize = 3;

private:
    class StringStream final : public remote::ByteStream {
    public:
        StringStream(std::string data, const std::size_t chunk) : data_(std::move(data)), chunk_(chunk) {}

        std::size_t read(char* dst, const std::size_t n) override {
            const auto count = std::min({n, chunk_, data_.size() - pos_});
            std::memcpy(dst, data_.data() + pos_, count);
            pos_ += count;
            return count;
        }

    private:
        std::string data_;
        std::size_t chunk_;
        std::size_t pos_ = 0;
    };

    int64_t nextId_ = 100;
    std::map<int64_t, Entry> entries_;
    std::map<int64_t, std::string> contents_;
};

}
