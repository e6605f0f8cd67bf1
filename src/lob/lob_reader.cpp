/**
 * @file lob_reader.cpp
 * @brief LOB tree traversal
 */

#include "lob/lob_reader.hpp"

#include "common/config.hpp"
#include "common/logger.hpp"
#include "common/status.hpp"
#include "storage/page.hpp"

namespace mdfkit {

LobReader::LobReader(std::shared_ptr<PageSource> source, LobDescriptor descriptor,
                     LobReadPolicy policy)
    : source_(std::move(source)), descriptor_(std::move(descriptor)), policy_(policy) {}

void LobReader::reset() {
    stack_.clear();
    started_ = false;
    done_ = false;
    truncated_ = false;
    bytes_read_ = 0;
    status_ = Status::Ok();
    warning_ = Status::Ok();
}

void LobReader::stop(Status status) {
    done_ = true;
    stack_.clear();
    if (policy_ == LobReadPolicy::kTruncate) {
        LOG_WARN("LOB value truncated after {} bytes: {}", bytes_read_, status.to_string());
        truncated_ = true;
        warning_ = std::move(status);
    } else {
        status_ = std::move(status);
    }
}

bool LobReader::next(LobChunk* chunk) {
    if (done_) {
        return false;
    }

    if (!started_) {
        started_ = true;
        switch (descriptor_.kind()) {
            case LobDescriptorKind::kInline:
                done_ = true;
                if (descriptor_.inline_data().empty()) {
                    return false;
                }
                chunk->offset = 0;
                chunk->data = descriptor_.inline_data();
                bytes_read_ = chunk->data.size();
                return true;

            case LobDescriptorKind::kTextPointer: {
                bool produced = false;
                Status status = visit(descriptor_.root(), std::nullopt, 0, chunk, &produced);
                if (!status.ok()) {
                    stop(std::move(status));
                    return false;
                }
                if (produced) {
                    return true;
                }
                break;
            }

            case LobDescriptorKind::kRowOverflow:
            case LobDescriptorKind::kInlineRoot:
                stack_.push_back(Frame{descriptor_.links(), 0, 0, 0, 1});
                break;
        }
    }

    while (!stack_.empty()) {
        Frame& frame = stack_.back();
        if (frame.next >= frame.links.size()) {
            stack_.pop_back();
            continue;
        }

        const LobLink link = frame.links[frame.next++];
        const uint64_t end = link.end_offset + frame.base;
        if (end < frame.cursor) {
            stop(Status::BrokenLobChain("link to " + link.target.to_string() + " ends at " +
                                        std::to_string(end) + " before its start " +
                                        std::to_string(frame.cursor)));
            return false;
        }
        const Span span{frame.cursor, end};
        const size_t depth = frame.depth;
        frame.cursor = end;

        // visit() may push a frame; `frame` is not used past this point
        bool produced = false;
        Status status = visit(link.target, span, depth, chunk, &produced);
        if (!status.ok()) {
            stop(std::move(status));
            return false;
        }
        if (produced) {
            return true;
        }
    }

    done_ = true;
    return false;
}

Status LobReader::visit(RecordPointer target, std::optional<Span> span, size_t depth,
                        LobChunk* chunk, bool* produced) {
    *produced = false;

    std::shared_ptr<const Page> page;
    Status status = fetch_page(*source_, target.page, &page);
    if (!status.ok()) {
        return Status::BrokenLobChain("cannot read LOB page " + target.page.to_string() + ": " +
                                      status.to_string());
    }
    if (!is_lob_page(page->type())) {
        return Status::BrokenLobChain("LOB link " + target.to_string() + " points to a " +
                                      page_type_name(page->type()) + " page");
    }

    Record record;
    status = page->record(target.slot, &record);
    if (!status.ok()) {
        return Status::BrokenLobChain("cannot read LOB node " + target.to_string() + ": " +
                                      status.to_string());
    }

    LobNode node;
    MDFKIT_RETURN_IF_ERROR(LobNode::parse(record, &node));

    if (node.type == LobNodeType::kNull) {
        return Status::Ok();
    }

    if (node.is_leaf()) {
        ByteSpan data = node.data;
        uint64_t offset = bytes_read_;
        if (span.has_value()) {
            const uint64_t length = span->end - span->start;
            if (data.size() < length) {
                return Status::BrokenLobChain("fragment " + target.to_string() + " holds " +
                                              std::to_string(data.size()) +
                                              " bytes, link covers " + std::to_string(length));
            }
            data = data.first(static_cast<size_t>(length));
            offset = span->start;
        }
        if (data.empty()) {
            return Status::Ok();
        }
        chunk->offset = offset;
        chunk->data.assign(data.begin(), data.end());
        bytes_read_ += data.size();
        *produced = true;
        return Status::Ok();
    }

    if (depth + 1 > config::kMaxLobDepth) {
        return Status::BrokenLobChain("LOB tree deeper than " +
                                      std::to_string(config::kMaxLobDepth) + " levels at " +
                                      target.to_string());
    }

    Frame frame;
    frame.links = std::move(node.links);
    frame.depth = depth + 1;
    if (span.has_value()) {
        frame.cursor = span->start;
        // Child offsets are either absolute or relative to the subtree start
        const uint64_t last = frame.links.empty() ? 0 : frame.links.back().end_offset;
        if (span->start != 0 && last != span->end && last == span->end - span->start) {
            frame.base = span->start;
        }
    }
    LOG_TRACE("LOB node {} ({}) with {} links at depth {}", target.to_string(),
              lob_node_type_name(static_cast<uint16_t>(node.type)), frame.links.size(),
              frame.depth);
    stack_.push_back(std::move(frame));
    return Status::Ok();
}

Status LobReader::read_all(std::vector<uint8_t>* out) {
    out->clear();
    LobChunk chunk;
    while (next(&chunk)) {
        out->insert(out->end(), chunk.data.begin(), chunk.data.end());
    }
    return status_;
}

}  // namespace mdfkit
