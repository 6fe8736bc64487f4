#ifndef GRAVDIR_SERIALIZATION_MEMORY_ARCHIVE_HPP
#define GRAVDIR_SERIALIZATION_MEMORY_ARCHIVE_HPP

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <type_traits>
#include <vector>

namespace gravdir {

/**
 * @brief Reads fundamental values from a byte buffer in the order they
 * were written by a `memory_output_archive`. Non-fundamental types are
 * forwarded to a `serialize(archive, value)` overload found via ADL.
 * Running past the end of the buffer sets the `failed` flag and all
 * subsequent reads are ignored.
 */
class memory_input_archive {
public:
    using data_type = uint8_t;
    using buffer_type = const data_type*;
    using is_input = std::true_type;
    using is_output = std::false_type;

    memory_input_archive(buffer_type buffer, size_t size)
        : m_buffer(buffer)
        , m_size(size)
        , m_position(0)
        , m_failed(false)
    {}

    template<typename T>
    void operator()(T &t) {
        if constexpr(std::is_arithmetic_v<T>) {
            read_bytes(t);
        } else {
            serialize(*this, t);
        }
    }

    template<typename... Ts>
    void operator()(Ts &... t) {
        (operator()(t), ...);
    }

    bool failed() const {
        return m_failed;
    }

    bool eof() const {
        return m_position == m_size;
    }

private:
    template<typename T>
    void read_bytes(T &t) {
        if (m_failed) return;

        if (m_position + sizeof(T) > m_size) {
            m_failed = true;
            return;
        }

        std::memcpy(&t, m_buffer + m_position, sizeof(T));
        m_position += sizeof(T);
    }

    buffer_type m_buffer;
    const size_t m_size;
    size_t m_position;
    bool m_failed;
};

/**
 * @brief Appends the bytes of fundamental values to a growable buffer.
 */
class memory_output_archive {
public:
    using data_type = uint8_t;
    using buffer_type = std::vector<data_type>;
    using is_input = std::false_type;
    using is_output = std::true_type;

    memory_output_archive(buffer_type &buffer)
        : m_buffer(&buffer)
    {}

    template<typename T>
    void operator()(T &t) {
        if constexpr(std::is_arithmetic_v<T>) {
            write_bytes(t);
        } else {
            serialize(*this, t);
        }
    }

    template<typename T>
    void operator()(const T &t) {
        if constexpr(std::is_arithmetic_v<T>) {
            write_bytes(t);
        } else {
            // Output archives only read from `t`.
            serialize(*this, const_cast<T &>(t));
        }
    }

    template<typename... Ts>
    void operator()(Ts &... t) {
        (operator()(t), ...);
    }

private:
    template<typename T>
    void write_bytes(const T &t) {
        auto idx = m_buffer->size();
        m_buffer->resize(idx + sizeof(T));
        std::memcpy(m_buffer->data() + idx, &t, sizeof(T));
    }

    buffer_type *m_buffer;
};

/**
 * @brief Writes into a caller-provided buffer of fixed size. Sets the
 * `failed` flag instead of writing past the end.
 */
class fixed_memory_output_archive {
public:
    using data_type = uint8_t;
    using buffer_type = data_type*;
    using is_input = std::false_type;
    using is_output = std::true_type;

    fixed_memory_output_archive(buffer_type buffer, size_t size)
        : m_buffer(buffer)
        , m_size(size)
        , m_position(0)
        , m_failed(false)
    {}

    template<typename T>
    void operator()(T &t) {
        if constexpr(std::is_arithmetic_v<T>) {
            write_bytes(t);
        } else {
            serialize(*this, t);
        }
    }

    template<typename... Ts>
    void operator()(Ts &... t) {
        (operator()(t), ...);
    }

    bool failed() const {
        return m_failed;
    }

    size_t size() const {
        return m_position;
    }

private:
    template<typename T>
    void write_bytes(const T &t) {
        if (m_failed) return;

        if (m_position + sizeof(T) > m_size) {
            m_failed = true;
            return;
        }

        std::memcpy(m_buffer + m_position, &t, sizeof(T));
        m_position += sizeof(T);
    }

    buffer_type m_buffer;
    size_t m_size;
    size_t m_position;
    bool m_failed;
};

}

#endif // GRAVDIR_SERIALIZATION_MEMORY_ARCHIVE_HPP
