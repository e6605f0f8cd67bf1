/**
 * @file file_page_source.cpp
 * @brief FilePageSource implementation
 */

#include "storage/file_page_source.hpp"

#include "common/logger.hpp"
#include "common/status.hpp"

namespace mdfkit {

Status FilePageSource::open(const std::string& path, std::unique_ptr<FilePageSource>* out) {
    auto source = std::make_unique<FilePageSource>();
    MDFKIT_RETURN_IF_ERROR(source->add_file(config::kPrimaryFileId, path));
    *out = std::move(source);
    return Status::Ok();
}

Status FilePageSource::add_file(file_id_t file_id, const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (files_.count(file_id) != 0) {
        return Status::InvalidArgument("file id " + std::to_string(file_id) +
                                       " already registered");
    }

    auto file = std::make_unique<DataFile>();
    file->path = path;
    file->stream.open(path, std::ios::binary | std::ios::in);
    if (!file->stream.is_open()) {
        LOG_ERROR("Failed to open data file: {}", path);
        return Status::IOError("cannot open " + path);
    }

    // Determine number of pages
    file->stream.seekg(0, std::ios::end);
    auto file_size = file->stream.tellg();
    if (file_size < 0) {
        return Status::IOError("cannot determine size of " + path);
    }
    const auto page_size = static_cast<std::streamoff>(config::kPageSize);
    file->num_pages = static_cast<page_id_t>(file_size / page_size);
    if (file_size % page_size != 0) {
        LOG_WARN("{} has a trailing partial page ({} bytes ignored)", path,
                 static_cast<long long>(file_size % page_size));
    }

    LOG_INFO("Opened data file {} as file {} with {} pages", path, file_id, file->num_pages);
    files_[file_id] = std::move(file);
    return Status::Ok();
}

Status FilePageSource::read_page(PagePointer pointer, std::span<uint8_t> out) {
    if (out.size() != config::kPageSize) {
        return Status::InvalidArgument("page buffer must be one page");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = files_.find(pointer.file_id);
    if (it == files_.end()) {
        return Status::NotFound("no data file with id " + std::to_string(pointer.file_id));
    }
    DataFile& file = *it->second;
    if (pointer.page_id >= file.num_pages) {
        return Status::NotFound("page " + pointer.to_string() + " is beyond the end of " +
                                file.path);
    }

    const auto offset = static_cast<std::streamoff>(pointer.page_id) *
                        static_cast<std::streamoff>(config::kPageSize);
    file.stream.clear();
    file.stream.seekg(offset, std::ios::beg);
    if (!file.stream) {
        return Status::IOError("failed to seek to page " + pointer.to_string());
    }

    file.stream.read(reinterpret_cast<char*>(out.data()),
                     static_cast<std::streamsize>(config::kPageSize));
    if (file.stream.gcount() != static_cast<std::streamsize>(config::kPageSize)) {
        return Status::IOError("short read on page " + pointer.to_string());
    }

    return Status::Ok();
}

std::vector<file_id_t> FilePageSource::file_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<file_id_t> ids;
    ids.reserve(files_.size());
    for (const auto& [file_id, file] : files_) {
        ids.push_back(file_id);
    }
    return ids;
}

page_id_t FilePageSource::page_count(file_id_t file_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files_.find(file_id);
    return it == files_.end() ? 0 : it->second->num_pages;
}

}  // namespace mdfkit
