#pragma once

/**
 * @file file_page_source.hpp
 * @brief PageSource backed by .mdf/.ndf files on disk
 */

#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "common/macros.hpp"
#include "storage/page_source.hpp"

namespace mdfkit {

/**
 * @brief Reads pages directly from database files
 *
 * The primary file is registered as file id 1; secondary data files can be
 * added with add_file(). Files are opened read-only and never modified. A
 * trailing partial page is not addressable.
 */
class FilePageSource : public PageSource {
public:
    FilePageSource() = default;
    ~FilePageSource() override = default;

    MDFKIT_DISALLOW_COPY_AND_MOVE(FilePageSource);

    /**
     * @brief Open a primary data file
     * @param path Path to the .mdf file
     * @param out Receives the source on success
     */
    [[nodiscard]] static Status open(const std::string& path,
                                     std::unique_ptr<FilePageSource>* out);

    /**
     * @brief Register a data file under a file id
     * @return InvalidArgument if the id is taken, IOError if the file cannot be opened
     */
    [[nodiscard]] Status add_file(file_id_t file_id, const std::string& path);

    [[nodiscard]] Status read_page(PagePointer pointer, std::span<uint8_t> out) override;
    [[nodiscard]] std::vector<file_id_t> file_ids() const override;
    [[nodiscard]] page_id_t page_count(file_id_t file_id) const override;

private:
    struct DataFile {
        std::string path;
        std::ifstream stream;
        page_id_t num_pages = 0;
    };

    std::map<file_id_t, std::unique_ptr<DataFile>> files_;
    mutable std::mutex mutex_;
};

}  // namespace mdfkit
