#ifndef FRAMEBUFFERPOOL_H
#define FRAMEBUFFERPOOL_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <opencv2/core.hpp>
#include <QtGlobal>

/**
 * Aligned allocation helpers for frame payloads
 * Provides 32-byte aligned memory so encoders and color conversion can use SIMD paths
 */
class AlignedAllocator {
public:
    /**
     * Allocate aligned memory
     * @param size Size in bytes to allocate
     * @param alignment Alignment requirement (power of two, default 32 bytes)
     * @return Pointer to aligned memory or nullptr on failure
     */
    static void* allocate(size_t size, size_t alignment = 32);

    /**
     * Deallocate memory allocated with allocate()
     * @param ptr Pointer to release (nullptr is ignored)
     */
    static void deallocate(void* ptr);
};

/**
 * Owning frame payload with a zero-copy cv::Mat view
 *
 * Move-only: a payload has exactly one owner at a time and is freed
 * synchronously by reset() or the destructor.
 */
class FrameBuffer {
private:
    std::unique_ptr<uint8_t[], void(*)(void*)> m_data;
    cv::Mat m_mat;
    size_t m_size;
    bool m_isValid;

public:
    FrameBuffer();

    /**
     * Allocate an uninitialised frame
     * @param rows Image height
     * @param cols Image width
     * @param type OpenCV matrix type (e.g., CV_8UC3)
     */
    FrameBuffer(int rows, int cols, int type);

    FrameBuffer(FrameBuffer&& other) noexcept;
    FrameBuffer& operator=(FrameBuffer&& other) noexcept;

    FrameBuffer(const FrameBuffer&) = delete;
    FrameBuffer& operator=(const FrameBuffer&) = delete;

    ~FrameBuffer();

    /**
     * Get a Mat view of the buffer data (zero-copy)
     * @return cv::Mat that references the internal buffer
     */
    cv::Mat getMatView() const { return m_mat; }

    bool isValid() const { return m_isValid; }
    size_t size() const { return m_size; }
    int width() const { return m_mat.cols; }
    int height() const { return m_mat.rows; }
    uint8_t* data() const { return m_data.get(); }

    /**
     * Free the payload immediately
     */
    void reset();

    /**
     * Create a FrameBuffer holding a copy of a cv::Mat
     * @param mat Source image
     * @return Valid buffer, or an invalid one if mat is empty or allocation failed
     */
    static FrameBuffer fromMat(const cv::Mat& mat);
};

/**
 * A frame owned by FrameBufferPool
 */
struct FrameHandle {
    quint64 id = 0;
    FrameBuffer frame;
    std::chrono::steady_clock::time_point acquiredAt;
};

/**
 * Read-only pool statistics
 */
struct BufferPoolDiagnostics {
    int currentCount = 0;
    int maxBuffers = 0;
    quint64 totalAllocated = 0;
    quint64 totalEvicted = 0;
    quint64 totalReleased = 0;
    double estimatedMemoryMB = 0.0;
    std::optional<double> oldestBufferAgeSeconds;
};

/**
 * Bounded frame pool with FIFO eviction
 *
 * Every mutation goes through one mutex. Diagnostics are mirrored into
 * atomics so monitoring code can read them without touching that mutex.
 * Handles leave the pool in exactly one way: eviction, release, or
 * take()/takeOldest(), which move the payload to the caller.
 */
class FrameBufferPool {
public:
    static constexpr int DEFAULT_MAX_BUFFERS = 100;
    static constexpr double SLOW_ADD_WARNING_MS = 10.0;

    explicit FrameBufferPool(int maxBuffers = DEFAULT_MAX_BUFFERS);
    ~FrameBufferPool();

    FrameBufferPool(const FrameBufferPool&) = delete;
    FrameBufferPool& operator=(const FrameBufferPool&) = delete;

    /**
     * Admit a frame, evicting the oldest live handle first if the pool is full
     * @param frame Payload to take ownership of
     * @return Handle id (ids increase monotonically with acquisition time)
     */
    quint64 add(FrameBuffer&& frame);

    /**
     * Free a frame. Unknown ids are ignored.
     * @param handleId Id returned by add()
     */
    void release(quint64 handleId);

    /**
     * Free every frame in the pool
     * @return Number of frames freed
     */
    int releaseAll();

    /**
     * Move a frame out of the pool
     * @param handleId Id returned by add()
     * @return The handle, or std::nullopt if it is no longer live
     */
    std::optional<FrameHandle> take(quint64 handleId);

    /**
     * Move the oldest frame out of the pool
     * @return The handle, or std::nullopt if the pool is empty
     */
    std::optional<FrameHandle> takeOldest();

    int count() const;
    int maxBuffers() const { return m_maxBuffers; }

    /**
     * Lock-free snapshot of pool statistics
     */
    BufferPoolDiagnostics diagnostics() const;

private:
    void removeLocked(std::map<quint64, FrameHandle>::iterator it);
    void publishOldestLocked();

    const int m_maxBuffers;

    // Keyed by id; ids are issued in acquisition order so begin() is the oldest
    std::map<quint64, FrameHandle> m_handles;
    quint64 m_nextId = 1;
    mutable std::mutex m_poolMutex;

    std::atomic<int> m_count{0};
    std::atomic<quint64> m_totalAllocated{0};
    std::atomic<quint64> m_totalEvicted{0};
    std::atomic<quint64> m_totalReleased{0};
    std::atomic<quint64> m_bytesInUse{0};
    std::atomic<qint64> m_oldestAcquiredNs{0};
};

#endif // FRAMEBUFFERPOOL_H
