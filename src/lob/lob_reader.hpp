#pragma once

/**
 * @file lob_reader.hpp
 * @brief Streaming reassembly of LOB values
 */

#include <memory>
#include <optional>
#include <vector>

#include "common/macros.hpp"
#include "lob/lob_descriptor.hpp"
#include "lob/lob_node.hpp"
#include "storage/page_source.hpp"

namespace mdfkit {

/**
 * @brief What to do when the LOB tree cannot be followed
 */
enum class LobReadPolicy : uint8_t {
    kAbort,     // stop and report BrokenLobChain through status()
    kTruncate,  // stop, keep what was produced, report through warning()
};

/**
 * @brief One contiguous fragment of a LOB value
 */
struct LobChunk {
    uint64_t offset = 0;  // position of data[0] within the value
    std::vector<uint8_t> data;
};

/**
 * @brief Pull-based in-order traversal of a LOB tree
 *
 * Each call to next() reads at most one page and produces at most one
 * fragment, so arbitrarily large values never sit in memory as a whole.
 * A reader is single-pass; construct a new one (or call reset()) to read
 * the value again.
 *
 * @code
 *   LobReader reader(source, value.as_lob());
 *   LobChunk chunk;
 *   while (reader.next(&chunk)) {
 *       out.write(chunk.data);
 *   }
 *   if (!reader.status().ok()) { ... }
 * @endcode
 */
class LobReader {
public:
    LobReader(std::shared_ptr<PageSource> source, LobDescriptor descriptor,
              LobReadPolicy policy = LobReadPolicy::kAbort);

    MDFKIT_DEFAULT_MOVE(LobReader);
    MDFKIT_DISALLOW_COPY(LobReader);

    /**
     * @brief Produce the next fragment
     * @return false when the value is exhausted or the traversal stopped
     */
    bool next(LobChunk* chunk);

    /// Start over from the descriptor
    void reset();

    /// BrokenLobChain after an aborted traversal, otherwise OK
    [[nodiscard]] const Status& status() const noexcept { return status_; }

    /// Reason for truncation under LobReadPolicy::kTruncate
    [[nodiscard]] const Status& warning() const noexcept { return warning_; }

    [[nodiscard]] bool is_truncated() const noexcept { return truncated_; }
    [[nodiscard]] bool is_done() const noexcept { return done_; }
    [[nodiscard]] uint64_t bytes_read() const noexcept { return bytes_read_; }

    /**
     * @brief Drain the reader into one buffer
     *
     * Convenience for small values. Under kTruncate the prefix is kept and
     * OK is returned; check is_truncated().
     */
    [[nodiscard]] Status read_all(std::vector<uint8_t>* out);

private:
    struct Frame {
        std::vector<LobLink> links;
        size_t next = 0;
        uint64_t cursor = 0;  // value offset where the next link starts
        uint64_t base = 0;    // added to link offsets stored relative to the subtree
        size_t depth = 0;
    };

    struct Span {
        uint64_t start = 0;
        uint64_t end = 0;
    };

    /// Visit one node; leaves fill `chunk` and set `produced`
    [[nodiscard]] Status visit(RecordPointer target, std::optional<Span> span, size_t depth,
                               LobChunk* chunk, bool* produced);

    /// Stop the traversal according to the policy
    void stop(Status status);

    std::shared_ptr<PageSource> source_;
    LobDescriptor descriptor_;
    LobReadPolicy policy_;

    std::vector<Frame> stack_;
    bool started_ = false;
    bool done_ = false;
    bool truncated_ = false;
    uint64_t bytes_read_ = 0;
    Status status_;
    Status warning_;
};

}  // namespace mdfkit
