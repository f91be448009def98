#include "framebufferpool.h"
#include "diagnosticslog.h"
#include <cstdlib>
#include <algorithm>

// ============================================================================
// AlignedAllocator Implementation
// ============================================================================

void* AlignedAllocator::allocate(size_t size, size_t alignment) {
    if (size == 0) {
        return nullptr;
    }

    // Ensure alignment is a power of 2
    if (alignment == 0 || (alignment & (alignment - 1)) != 0) {
        alignment = 32;
    }

#ifdef _WIN32
    return _aligned_malloc(size, alignment);
#else
    void* ptr = nullptr;
    if (posix_memalign(&ptr, alignment, size) != 0) {
        return nullptr;
    }
    return ptr;
#endif
}

void AlignedAllocator::deallocate(void* ptr) {
    if (ptr == nullptr) {
        return;
    }

#ifdef _WIN32
    _aligned_free(ptr);
#else
    free(ptr);
#endif
}

// ============================================================================
// FrameBuffer Implementation
// ============================================================================

FrameBuffer::FrameBuffer()
    : m_data(nullptr, AlignedAllocator::deallocate), m_size(0), m_isValid(false) {
}

FrameBuffer::FrameBuffer(int rows, int cols, int type)
    : m_data(nullptr, AlignedAllocator::deallocate), m_size(0), m_isValid(false) {

    if (rows <= 0 || cols <= 0) {
        return;
    }

    size_t elemSize = CV_ELEM_SIZE(type);
    if (elemSize == 0) {
        return;
    }

    size_t bytes = static_cast<size_t>(rows) * static_cast<size_t>(cols) * elemSize;
    uint8_t* rawPtr = static_cast<uint8_t*>(AlignedAllocator::allocate(bytes, 32));
    if (!rawPtr) {
        return;
    }

    m_data.reset(rawPtr);
    m_size = bytes;
    m_mat = cv::Mat(rows, cols, type, rawPtr);
    m_isValid = true;
}

FrameBuffer::FrameBuffer(FrameBuffer&& other) noexcept
    : m_data(std::move(other.m_data)), m_mat(std::move(other.m_mat)),
      m_size(other.m_size), m_isValid(other.m_isValid) {

    other.m_mat = cv::Mat();
    other.m_size = 0;
    other.m_isValid = false;
}

FrameBuffer& FrameBuffer::operator=(FrameBuffer&& other) noexcept {
    if (this != &other) {
        // Drop the view before the storage it points into
        m_mat = cv::Mat();
        m_data = std::move(other.m_data);
        m_mat = std::move(other.m_mat);
        m_size = other.m_size;
        m_isValid = other.m_isValid;

        other.m_mat = cv::Mat();
        other.m_size = 0;
        other.m_isValid = false;
    }
    return *this;
}

FrameBuffer::~FrameBuffer() {
    reset();
}

void FrameBuffer::reset() {
    m_mat = cv::Mat();
    m_data.reset();
    m_size = 0;
    m_isValid = false;
}

FrameBuffer FrameBuffer::fromMat(const cv::Mat& mat) {
    if (mat.empty()) {
        return FrameBuffer();
    }

    FrameBuffer buffer(mat.rows, mat.cols, mat.type());
    if (buffer.isValid()) {
        mat.copyTo(buffer.m_mat);
    }

    return buffer;
}

// ============================================================================
// FrameBufferPool Implementation
// ============================================================================

FrameBufferPool::FrameBufferPool(int maxBuffers)
    : m_maxBuffers(maxBuffers > 0 ? maxBuffers : DEFAULT_MAX_BUFFERS) {
}

FrameBufferPool::~FrameBufferPool() {
    releaseAll();
}

quint64 FrameBufferPool::add(FrameBuffer&& frame) {
    PERF_TIMER_WARN("FrameBufferPool::add", "FrameBufferPool", SLOW_ADD_WARNING_MS);

    std::lock_guard<std::mutex> lock(m_poolMutex);

    while (static_cast<int>(m_handles.size()) >= m_maxBuffers) {
        auto oldest = m_handles.begin();
        LOG_DEBUG("FrameBufferPool", "Evicting frame " + std::to_string(oldest->first) + " (pool full)");
        removeLocked(oldest);
        m_totalEvicted.fetch_add(1);
    }

    quint64 id = m_nextId++;
    size_t bytes = frame.size();

    FrameHandle handle;
    handle.id = id;
    handle.frame = std::move(frame);
    handle.acquiredAt = std::chrono::steady_clock::now();
    m_handles.emplace(id, std::move(handle));

    m_totalAllocated.fetch_add(1);
    m_bytesInUse.fetch_add(bytes);
    m_count.store(static_cast<int>(m_handles.size()));
    publishOldestLocked();

    return id;
}

void FrameBufferPool::release(quint64 handleId) {
    std::lock_guard<std::mutex> lock(m_poolMutex);

    auto it = m_handles.find(handleId);
    if (it == m_handles.end()) {
        return;
    }

    removeLocked(it);
    m_totalReleased.fetch_add(1);
    publishOldestLocked();
}

int FrameBufferPool::releaseAll() {
    std::lock_guard<std::mutex> lock(m_poolMutex);

    int released = static_cast<int>(m_handles.size());
    while (!m_handles.empty()) {
        removeLocked(m_handles.begin());
    }
    m_totalReleased.fetch_add(static_cast<quint64>(released));
    publishOldestLocked();

    return released;
}

std::optional<FrameHandle> FrameBufferPool::take(quint64 handleId) {
    std::lock_guard<std::mutex> lock(m_poolMutex);

    auto it = m_handles.find(handleId);
    if (it == m_handles.end()) {
        return std::nullopt;
    }

    FrameHandle handle = std::move(it->second);
    m_bytesInUse.fetch_sub(handle.frame.size());
    m_handles.erase(it);
    m_count.store(static_cast<int>(m_handles.size()));
    publishOldestLocked();

    return handle;
}

std::optional<FrameHandle> FrameBufferPool::takeOldest() {
    std::lock_guard<std::mutex> lock(m_poolMutex);

    if (m_handles.empty()) {
        return std::nullopt;
    }

    auto it = m_handles.begin();
    FrameHandle handle = std::move(it->second);
    m_bytesInUse.fetch_sub(handle.frame.size());
    m_handles.erase(it);
    m_count.store(static_cast<int>(m_handles.size()));
    publishOldestLocked();

    return handle;
}

int FrameBufferPool::count() const {
    return m_count.load();
}

BufferPoolDiagnostics FrameBufferPool::diagnostics() const {
    BufferPoolDiagnostics info;
    info.currentCount = m_count.load();
    info.maxBuffers = m_maxBuffers;
    info.totalAllocated = m_totalAllocated.load();
    info.totalEvicted = m_totalEvicted.load();
    info.totalReleased = m_totalReleased.load();
    info.estimatedMemoryMB = static_cast<double>(m_bytesInUse.load()) / (1024.0 * 1024.0);

    qint64 oldestNs = m_oldestAcquiredNs.load();
    if (info.currentCount > 0 && oldestNs != 0) {
        qint64 nowNs = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now().time_since_epoch()).count();
        info.oldestBufferAgeSeconds = std::max<qint64>(0, nowNs - oldestNs) / 1e9;
    }

    return info;
}

void FrameBufferPool::removeLocked(std::map<quint64, FrameHandle>::iterator it) {
    m_bytesInUse.fetch_sub(it->second.frame.size());
    // Payload is freed here, before the slot can be reused
    it->second.frame.reset();
    m_handles.erase(it);
    m_count.store(static_cast<int>(m_handles.size()));
}

void FrameBufferPool::publishOldestLocked() {
    if (m_handles.empty()) {
        m_oldestAcquiredNs.store(0);
        return;
    }

    m_oldestAcquiredNs.store(std::chrono::duration_cast<std::chrono::nanoseconds>(
        m_handles.begin()->second.acquiredAt.time_since_epoch()).count());
}
