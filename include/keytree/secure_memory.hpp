/**
 * @file secure_memory.hpp
 * @brief Memory-hardened containers for private key material.
 * @author Keytree Project
 * @date 2026
 */

#ifndef KEYTREE_SECURE_MEMORY_HPP
#define KEYTREE_SECURE_MEMORY_HPP

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <new>
#include <string_view>
#include <vector>

#if defined(_WIN32) || defined(_WIN64)
    #include <windows.h>
#endif

namespace Keytree {

    /**
     * @brief Optimization-resistant memory zeroization.
     */
    inline void secure_memzero(void* ptr, size_t size) noexcept {
        if (!ptr || size == 0) return;

#if defined(_WIN32) || defined(_WIN64)
        RtlSecureZeroMemory(ptr, size);
#elif defined(__STDC_LIB_EXT1__)
        memset_s(ptr, size, 0, size);
#else
        volatile unsigned char* p = static_cast<volatile unsigned char*>(ptr);
        while (size--) *p++ = 0;
        std::atomic_thread_fence(std::memory_order_seq_cst);
#endif
    }

    /**
     * @brief Constant-time comparison of two buffers of equal length.
     *
     * Runs over every byte regardless of where the first difference is.
     */
    inline bool secure_equals(const void* a, const void* b, size_t size) noexcept {
        const volatile unsigned char* pa = static_cast<const volatile unsigned char*>(a);
        const volatile unsigned char* pb = static_cast<const volatile unsigned char*>(b);
        volatile unsigned char diff = 0;
        for (size_t i = 0; i < size; ++i) {
            diff = diff | (pa[i] ^ pb[i]);
        }
        return diff == 0;
    }

    /**
     * @brief Custom allocator ensuring internal reallocations are zeroized.
     * Prevents "ghost data" from remaining in RAM after vector growth.
     */
    template <typename T>
    struct zero_allocator {
        using value_type = T;
        zero_allocator() = default;
        template <class U> constexpr zero_allocator(const zero_allocator<U>&) noexcept {}

        T* allocate(std::size_t n) {
            if (n > std::size_t(-1) / sizeof(T)) throw std::bad_alloc();
            if (auto p = static_cast<T*>(std::malloc(n * sizeof(T)))) return p;
            throw std::bad_alloc();
        }

        void deallocate(T* p, std::size_t n) noexcept {
            secure_memzero(p, n * sizeof(T));
            std::free(p);
        }
    };

    template <class T, class U>
    bool operator==(const zero_allocator<T>&, const zero_allocator<U>&) noexcept { return true; }

    template <class T, class U>
    bool operator!=(const zero_allocator<T>&, const zero_allocator<U>&) noexcept { return false; }

    /// Growable byte buffer that wipes every block it releases.
    using SecureBytes = std::vector<uint8_t, zero_allocator<uint8_t>>;

    /**
     * @class SecureString
     * @brief RAII container for secret text such as a serialized xprv.
     * Deleted copy constructors prevent accidental secret duplication.
     */
    class SecureString {
    private:
        std::vector<char, zero_allocator<char>> buffer;

    public:
        SecureString() = default;

        explicit SecureString(std::string_view str)
            : buffer(str.begin(), str.end()) {}

        ~SecureString() = default; // Zeroization handled by allocator

        SecureString(const SecureString&) = delete;
        SecureString& operator=(const SecureString&) = delete;

        SecureString(SecureString&&) noexcept = default;
        SecureString& operator=(SecureString&&) noexcept = default;

        char* data() { return buffer.data(); }
        const char* data() const { return buffer.data(); }
        std::size_t size() const { return buffer.size(); }
        bool empty() const { return buffer.empty(); }

        void reserve(std::size_t n) { buffer.reserve(n); }
        void push_back(char c) { buffer.push_back(c); }

        /// Non-owning view, valid while this object is alive and unchanged.
        std::string_view view() const { return std::string_view(buffer.data(), buffer.size()); }

        /**
         * @brief Constant-time comparison to prevent timing side-channel attacks.
         */
        bool operator==(std::string_view other) const {
            if (size() != other.size()) return false;
            return secure_equals(buffer.data(), other.data(), size());
        }

        bool operator==(const SecureString& other) const { return *this == other.view(); }

        bool operator!=(std::string_view other) const { return !(*this == other); }
        bool operator!=(const SecureString& other) const { return !(*this == other); }
    };

    /**
     * @class SecretArray
     * @brief Fixed-size scoped secret buffer.
     *
     * The bytes are overwritten when the object is destroyed, assigned over
     * or moved from, so every exit path (including exceptions) clears them.
     * Copies are independent and are erased on their own.
     */
    template <std::size_t N>
    class SecretArray {
    private:
        std::array<uint8_t, N> bytes_{};

    public:
        static constexpr std::size_t SIZE = N;

        SecretArray() = default;

        explicit SecretArray(const std::array<uint8_t, N>& bytes) : bytes_(bytes) {}

        SecretArray(const uint8_t* data, std::size_t len) {
            std::memcpy(bytes_.data(), data, len < N ? len : N);
        }

        ~SecretArray() { wipe(); }

        SecretArray(const SecretArray&) = default;
        SecretArray& operator=(const SecretArray&) = default;

        SecretArray(SecretArray&& other) noexcept : bytes_(other.bytes_) {
            other.wipe();
        }

        SecretArray& operator=(SecretArray&& other) noexcept {
            if (this != &other) {
                bytes_ = other.bytes_;
                other.wipe();
            }
            return *this;
        }

        uint8_t* data() noexcept { return bytes_.data(); }
        const uint8_t* data() const noexcept { return bytes_.data(); }
        constexpr std::size_t size() const noexcept { return N; }

        uint8_t& operator[](std::size_t i) { return bytes_[i]; }
        const uint8_t& operator[](std::size_t i) const { return bytes_[i]; }

        auto begin() noexcept { return bytes_.begin(); }
        auto end() noexcept { return bytes_.end(); }
        auto begin() const noexcept { return bytes_.begin(); }
        auto end() const noexcept { return bytes_.end(); }

        const std::array<uint8_t, N>& array() const noexcept { return bytes_; }

        void wipe() noexcept { secure_memzero(bytes_.data(), N); }

        /**
         * @brief Constant-time comparison to prevent timing side-channel attacks.
         */
        bool secureEquals(const SecretArray& other) const noexcept {
            return secure_equals(bytes_.data(), other.bytes_.data(), N);
        }

        bool operator==(const SecretArray& other) const noexcept { return secureEquals(other); }
        bool operator!=(const SecretArray& other) const noexcept { return !secureEquals(other); }
    };

} // namespace Keytree

#endif // KEYTREE_SECURE_MEMORY_HPP
