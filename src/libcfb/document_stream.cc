//
// Created by igor on 05/09/2025.
//

#include <cfb/document_stream.hh>
#include <cfb/document.hh>
#include <cfb/bulk_copy.hh>
#include <cfb/endian.hh>
#include <cfb/exceptions.hh>
#include <algorithm>

namespace cfb {

    document_stream::document_stream(block_resolver resolver, std::uint64_t size)
        : m_resolver(std::move(resolver))
        , m_size(size)
        , m_offset(0)
        , m_marked_offset(0)
        , m_closed(false) {
        THROW_ARGUMENT_IF(!m_resolver, "Cannot open document stream without a block resolver");
        refresh();
    }

    document_stream::document_stream(const document& doc)
        : document_stream(doc.resolver(), doc.size()) {
    }

    document_stream::~document_stream() {
        close();
    }

    std::uint64_t document_stream::available() const {
        check_open();
        return m_size - m_offset;
    }

    void document_stream::close() noexcept {
        m_closed = true;
    }

    void document_stream::mark(std::size_t) {
        check_open();
        m_marked_offset = m_offset;
    }

    void document_stream::reset() {
        check_open();
        m_offset = m_marked_offset;
        refresh();
    }

    std::int64_t document_stream::skip(std::int64_t n) {
        check_open();
        if (n < 0) {
            return 0;
        }

        // Clamped to the remaining bytes, so the target can neither
        // pass the end nor wrap below the current offset
        const std::uint64_t step = std::min(static_cast<std::uint64_t>(n), m_size - m_offset);
        m_offset += step;
        refresh();
        return static_cast<std::int64_t>(step);
    }

    int document_stream::read() {
        check_open();
        if (m_offset == m_size) {
            return eof;
        }

        int result = require_view().read_ubyte();
        m_offset++;
        refresh_if_exhausted();
        return result;
    }

    std::int64_t document_stream::read(void* dst, std::size_t dst_size, std::int64_t start, std::int64_t length) {
        check_open();
        check_range(dst, dst_size, start, length);

        if (length == 0) {
            return 0;
        }
        if (m_offset == m_size) {
            return eof;
        }

        const std::uint64_t limit = std::min(static_cast<std::uint64_t>(length), m_size - m_offset);
        copy_to(static_cast<std::byte*>(dst) + start, static_cast<std::size_t>(limit));
        return static_cast<std::int64_t>(limit);
    }

    std::int64_t document_stream::read(std::vector<std::byte>& buf) {
        if (buf.empty()) {
            check_open();
            return 0;
        }
        return read(buf.data(), buf.size(), 0, static_cast<std::int64_t>(buf.size()));
    }

    void document_stream::read_fully(void* dst, std::size_t dst_size, std::int64_t start, std::int64_t length) {
        check_open();
        check_range(dst, dst_size, start, length);
        copy_to(static_cast<std::byte*>(dst) + start, static_cast<std::size_t>(length));
    }

    void document_stream::read_fully(std::vector<std::byte>& buf) {
        if (buf.empty()) {
            check_open();
            return;
        }
        read_fully(buf.data(), buf.size(), 0, static_cast<std::int64_t>(buf.size()));
    }

    std::uint8_t document_stream::read_ubyte() {
        return static_cast<std::uint8_t>(read_le(1));
    }

    std::int8_t document_stream::read_byte() {
        return static_cast<std::int8_t>(read_le(1));
    }

    std::uint16_t document_stream::read_ushort() {
        return static_cast<std::uint16_t>(read_le(2));
    }

    std::int16_t document_stream::read_short() {
        return static_cast<std::int16_t>(read_le(2));
    }

    std::uint32_t document_stream::read_uint() {
        return static_cast<std::uint32_t>(read_le(4));
    }

    std::int32_t document_stream::read_int() {
        return static_cast<std::int32_t>(read_le(4));
    }

    std::int64_t document_stream::read_long() {
        return static_cast<std::int64_t>(read_le(8));
    }

    double document_stream::read_double() {
        return double_from_bits(read_le(8));
    }

    void document_stream::check_open() const {
        if (m_closed) {
            THROW_CLOSED("Cannot perform requested operation on a closed stream");
        }
    }

    void document_stream::check_range(const void* dst, std::size_t dst_size,
                                      std::int64_t start, std::int64_t length) const {
        THROW_ARGUMENT_IF(!dst, "Buffer must not be null");
        THROW_ARGUMENT_IF(start < 0 || length < 0,
                          "Negative buffer range: start ", start, ", length ", length);
        THROW_ARGUMENT_IF(static_cast<std::uint64_t>(start) > dst_size ||
                          static_cast<std::uint64_t>(length) > dst_size - static_cast<std::uint64_t>(start),
                          "Can't read past buffer boundaries: start ", start, ", length ", length,
                          ", buffer size ", dst_size);
    }

    void document_stream::copy_to(std::byte* dst, std::size_t length) {
        // Hands out the current view for the starting offset and fresh
        // views for every block after it
        const std::uint64_t start_offset = m_offset;
        block_supplier next_block = [this, start_offset](std::uint64_t offset) -> block_view* {
            if (offset >= m_size) {
                m_view.reset();
            } else if (offset != start_offset || !m_view) {
                m_view = m_resolver(offset);
            }
            return m_view ? &*m_view : nullptr;
        };

        try {
            m_offset = copy_blocks(dst, length, m_offset, m_size, next_block);
        } catch (const unexpected_eof_error&) {
            // The view no longer matches m_offset; drop it so later reads
            // report the damage instead of returning misplaced bytes
            m_view.reset();
            throw;
        }
        refresh_if_exhausted();
    }

    block_view& document_stream::require_view() {
        THROW_EOF_IF(!m_view || m_view->empty(),
                     "Reached end of document stream unexpectedly at offset ", m_offset,
                     " of ", m_size);
        return *m_view;
    }

    void document_stream::refresh() {
        if (m_offset < m_size) {
            m_view = m_resolver(m_offset);
        } else {
            m_view.reset();
        }
    }

    void document_stream::refresh_if_exhausted() {
        if (!m_view || m_view->empty()) {
            refresh();
        }
    }

    std::uint64_t document_stream::read_le(std::size_t width) {
        check_open();
        THROW_EOF_IF(width > m_size - m_offset, "Unexpected end of stream: ", width,
                     "-byte read at offset ", m_offset, " but only ", m_size - m_offset,
                     " bytes left");

        block_view& head = require_view();
        if (head.available() >= width) {
            std::uint64_t value;
            switch (width) {
                case 2:
                    value = head.read_ushort_le();
                    break;
                case 4:
                    value = head.read_int_le();
                    break;
                case 8:
                    value = head.read_long_le();
                    break;
                default:
                    value = head.read_le(width);
                    break;
            }
            m_offset += width;
            refresh_if_exhausted();
            return value;
        }

        // The value straddles blocks: the bytes left in the current view are
        // the low-order bytes, following views supply the rest in order.
        // Work on copies so a damaged chain leaves the stream untouched.
        std::uint64_t value = 0;
        std::uint64_t pos = m_offset;
        std::size_t consumed = 0;
        std::optional<block_view> view = head;
        while (true) {
            const std::size_t take = std::min(view->available(), width - consumed);
            value |= view->read_le(take) << (8 * consumed);
            consumed += take;
            pos += take;
            if (consumed == width) {
                break;
            }
            view = m_resolver(pos);
            THROW_EOF_IF(!view || view->empty(),
                         "Reached end of document stream unexpectedly at offset ", pos,
                         " while decoding a ", width, "-byte value");
        }

        m_offset = pos;
        m_view = view;
        refresh_if_exhausted();
        return value;
    }

} // namespace cfb
