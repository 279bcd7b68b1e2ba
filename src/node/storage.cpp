/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <atomic>
#include <cctype>
#include <sstream>
#include <stdexcept>

#include <unistd.h>

#include <dfms/error.hpp>
#include <dfms/node/storage.hpp>

namespace dfms {

namespace {

class InMemoryReader final : public StorageReader {
  public:
    InMemoryReader(std::vector<std::uint8_t> const& data) : data_{data} {}

    std::vector<std::uint8_t> read(std::size_t max_bytes) override {
        auto const n = std::min(max_bytes, data_.size() - pos_);
        auto const first = data_.begin() + static_cast<std::ptrdiff_t>(pos_);
        pos_ += n;
        return {first, first + static_cast<std::ptrdiff_t>(n)};
    }

  private:
    std::vector<std::uint8_t> const& data_;
    std::size_t pos_{0};
};

class FileReader final : public StorageReader {
  public:
    FileReader(std::filesystem::path const& path)
        : in_{path, std::ios::binary | std::ios::in} {
        DFMS_EXPECTS(
            in_.is_open(), "cannot open " + path.string() + " for reading", std::runtime_error
        );
    }

    std::vector<std::uint8_t> read(std::size_t max_bytes) override {
        std::vector<std::uint8_t> ret(max_bytes);
        in_.read(reinterpret_cast<char*>(ret.data()), static_cast<std::streamsize>(max_bytes));
        DFMS_EXPECTS(!in_.bad(), "I/O error while reading node storage", std::runtime_error);
        ret.resize(static_cast<std::size_t>(in_.gcount()));
        return ret;
    }

  private:
    std::ifstream in_;
};

std::string sanitize(std::string const& id) {
    std::string ret = id;
    std::ranges::replace_if(
        ret,
        [](unsigned char c) { return !std::isalnum(c) && c != '-' && c != '.'; },
        '_'
    );
    return ret;
}

}  // namespace

std::size_t InMemoryStorage::write(std::span<std::uint8_t const> data) {
    data_.insert(data_.end(), data.begin(), data.end());
    return data.size();
}

std::unique_ptr<StorageReader> InMemoryStorage::open_reader() {
    return std::make_unique<InMemoryReader>(data_);
}

void InMemoryStorage::release() {
    std::vector<std::uint8_t>{}.swap(data_);
}

std::string InMemoryStorage::str() const {
    std::stringstream ss;
    ss << "InMemoryStorage(size=" << format_nbytes(static_cast<double>(data_.size()))
       << ")";
    return ss.str();
}

FileStorage::FileStorage(std::filesystem::path path)
    : path_{std::move(path)},
      out_{path_, std::ios::binary | std::ios::out | std::ios::trunc} {
    DFMS_EXPECTS(
        out_.is_open(), "cannot create storage file " + path_.string(), std::runtime_error
    );
}

FileStorage::~FileStorage() noexcept {
    if (!released_) {
        out_.close();
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
}

std::size_t FileStorage::write(std::span<std::uint8_t const> data) {
    DFMS_EXPECTS(!released_, "write to released storage " + path_.string());
    out_.write(
        reinterpret_cast<char const*>(data.data()), static_cast<std::streamsize>(data.size())
    );
    DFMS_EXPECTS(out_.good(), "failed to write to " + path_.string(), std::runtime_error);
    size_ += data.size();
    return data.size();
}

std::unique_ptr<StorageReader> FileStorage::open_reader() {
    DFMS_EXPECTS(!released_, "read from released storage " + path_.string());
    out_.flush();
    DFMS_EXPECTS(out_.good(), "failed to flush " + path_.string(), std::runtime_error);
    return std::make_unique<FileReader>(path_);
}

void FileStorage::release() {
    if (released_) {
        return;
    }
    released_ = true;
    size_ = 0;
    out_.close();
    std::filesystem::remove(path_);
}

std::string FileStorage::str() const {
    std::stringstream ss;
    ss << "FileStorage(path=" << path_.string()
       << ", size=" << format_nbytes(static_cast<double>(size_)) << ")";
    return ss.str();
}

std::unique_ptr<Storage> make_storage(
    StorageKind kind, InstanceID const& instance_id, config::Options options
) {
    switch (kind) {
    case StorageKind::MEMORY:
        return std::make_unique<InMemoryStorage>();
    case StorageKind::FILE:
        {
            static std::atomic<std::uint64_t> counter{0};
            auto const dir = options.get<std::string>(
                "storage_dir",
                config::default_factory<std::string>(
                    std::filesystem::temp_directory_path().string()
                )
            );
            std::stringstream name;
            name << "dfms-" << ::getpid() << "-" << counter++ << "-"
                 << sanitize(instance_id);
            return std::make_unique<FileStorage>(std::filesystem::path{dir} / name.str());
        }
    }
    DFMS_FAIL("unknown storage kind", std::invalid_argument);
}

}  // namespace dfms
