/**
 * @file ParkGateTypes.h
 * @brief Types used across the ParkGate library
 */

#pragma once

#include <cstring>
#include <string>
#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <algorithm>

// Timing helpers & FreeRTOS wrappers are left out of native (host-only) builds
#ifndef NATIVE_TEST

#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "freertos/semphr.h"
#include "freertos/timers.h"

// ===================================================================================
// TIMING MACROS
// ===================================================================================

inline uint32_t TIME_MS()           { return (xTaskGetTickCount() * portTICK_PERIOD_MS); }
inline void WAIT_MS(uint32_t ms)    { vTaskDelay(pdMS_TO_TICKS(ms)); }

// ===================================================================================
// FREERTOS SYNCHRONIZATION
// ===================================================================================

/* @brief RAII wrapper for a FreeRTOS mutex
 * @note Waiters of equal priority are served in arrival order
 */
class Mutex {
public:
    Mutex() {
        _h = xSemaphoreCreateMutex();
        configASSERT(_h);
    }
    ~Mutex() {
        vSemaphoreDelete(_h);
    }
    Mutex(const Mutex&) = delete;
    Mutex& operator=(const Mutex&) = delete;

    /* @brief Take the mutex without waiting
     * @return True if the mutex was taken
     */
    bool tryLock() {
        return xSemaphoreTake(_h, 0) == pdTRUE;
    }

    /* @brief Take the mutex
     * @param wait Max time to wait (in ticks)
     * @return True if the mutex was taken
     */
    bool lock(TickType_t wait = portMAX_DELAY) {
        return xSemaphoreTake(_h, wait) == pdTRUE;
    }

    void unlock() {
        BaseType_t ok = xSemaphoreGive(_h);
        configASSERT(ok == pdTRUE);
    }

private:
    SemaphoreHandle_t _h;
};


/* @brief Scoped lock on a Mutex, released on every exit path
 * @param m The Mutex to take
 * @param wait Max time to wait (in ticks), 0 for a try-lock
 */
class Lock {
public:
    explicit Lock(Mutex& m, TickType_t wait = portMAX_DELAY)
        : _m(m), _locked(_m.lock(wait)) {}

    ~Lock() { if (_locked) _m.unlock(); }

    Lock(const Lock&) = delete;
    Lock& operator=(const Lock&) = delete;

    bool isLocked() const { return _locked; }

private:
    Mutex& _m;
    volatile bool _locked;
};

#endif // NATIVE_TEST


// ===================================================================================
// BYTEBUFFER
// ===================================================================================

/* @brief Non-owning, bounds-checked view over a raw byte array
 * @note Two flavours: writable (ptr + capacity, starts empty) and read-only
 *       (const ptr + size, starts full). Copy is disabled, move is allowed.
 */
class ByteBuffer {
public:
    ByteBuffer() noexcept
    : _data(nullptr), _size(0), _cap(0) {}

    ByteBuffer(uint8_t* ptr, size_t capacity) noexcept
        : _data(ptr), _size(0), _cap(capacity) {}

    ByteBuffer(const uint8_t* ptr, size_t size) noexcept
        : _data(const_cast<uint8_t*>(ptr)), _size(size), _cap(size) {}

    ByteBuffer(const ByteBuffer&) = delete;
    ByteBuffer& operator=(const ByteBuffer&) = delete;
    ByteBuffer(ByteBuffer&&) noexcept = default;
    ByteBuffer& operator=(ByteBuffer&&) noexcept = default;

    const uint8_t* data() const { return _data; }
    size_t         size() const { return _size; }
    size_t     capacity() const { return _cap; }
    bool          empty() const { return _size == 0; }
    size_t   free_space() const { return _cap - _size; }
    const uint8_t& operator[](size_t i) const { return _data[i]; }

    // Non-const iterators expose the raw storage for APIs that write through
    // a pointer (recv): resize() first, write, then trim() to the real length.
    uint8_t*       begin()       { return _data; }
    uint8_t*       end()         { return _data + _size; }
    const uint8_t* begin() const { return _data; }
    const uint8_t* end()   const { return _data + _size; }

    // Read-only view on [offset, offset + length), clamped to the current size
    ByteBuffer slice(size_t offset, size_t length) const {
        if (!_data || offset > _size) return ByteBuffer();
        if (offset + length > _size) length = _size - offset;
        return ByteBuffer(static_cast<const uint8_t*>(_data + offset), length);
    }

    void clear() { _size = 0; }

    bool resize(size_t newSize) {
        if (newSize > _cap || !_data) return false;
        if (newSize > _size) memset(_data + _size, 0, newSize - _size);
        _size = newSize;
        return true;
    }
    bool trim(size_t newSize) {
        if (!_data || newSize > _size) return false;
        _size = newSize;
        return true;
    }

    bool push_back(uint8_t b) {
        if (_size >= _cap || !_data) return false;
        _data[_size++] = b;
        return true;
    }
    // All bytes are appended or none
    bool push_back(const uint8_t* buf, size_t len) {
        if (_size + len > _cap || !_data) return false;
        if (len) memcpy(_data + _size, buf, len);
        _size += len;
        return true;
    }
    bool push_u16(uint16_t v) {
        if (free_space() < 2) return false;
        push_back(static_cast<uint8_t>(v >> 8));
        push_back(static_cast<uint8_t>(v & 0xFF));
        return true;
    }

    bool write_at(size_t pos, uint8_t b) {
        if (pos >= _cap || !_data) return false;
        _data[pos] = b;
        if (pos >= _size) _size = pos + 1;
        return true;
    }

    // Drop the first n bytes, keeping the capacity
    bool pop_front(size_t n) {
        if (n > _size) return false;
        if (n) {
            memmove(_data, _data + n, _size - n);
            _size -= n;
        }
        return true;
    }

private:
    uint8_t* _data;
    size_t   _size;
    size_t   _cap;
};

/* @brief Fixed-capacity byte storage bundled with its writable ByteBuffer view
 * @tparam N Capacity in bytes
 */
template<size_t N>
struct ByteArray {
    std::array<uint8_t, N> storage{};
    ByteBuffer buf{storage.data(), N};

    ByteArray() = default;
    ByteArray(const ByteArray&) = delete;
    ByteArray& operator=(const ByteArray&) = delete;

    ByteBuffer& operator*() { return buf; }
    ByteBuffer* operator->() { return &buf; }
    const ByteBuffer& operator*() const { return buf; }
    const ByteBuffer* operator->() const { return &buf; }
};
