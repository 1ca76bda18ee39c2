#pragma once

// ============================================================================
// FrameCoalescer - Last-value-wins frame scheduling
// ============================================================================
// Part of the ExamInk drawing engine
//
// update() stores the newest value and arms a single-shot timer if none is
// pending. When the timer fires, only the most recent value is delivered.
// Nothing is ever queued: at most one value is pending at any time.
// ============================================================================

#include <QObject>
#include <QTimer>
#include <functional>
#include <utility>

/**
 * @brief Coalesces bursts of values into at most one delivery per frame.
 * @tparam T Value type; delivered by const reference.
 */
template <typename T>
class FrameCoalescer
{
public:
    using Sink = std::function<void(const T&)>;

    static constexpr int DEFAULT_FRAME_MS = 16;   ///< ~60 Hz

    /**
     * @param sink Called with the latest value on each flush.
     * @param owner Parent for the internal timer (same thread).
     * @param frameMs Delay between the first update and its delivery.
     */
    explicit FrameCoalescer(Sink sink, QObject* owner = nullptr, int frameMs = DEFAULT_FRAME_MS)
        : m_sink(std::move(sink))
        , m_timer(new QTimer(owner))
    {
        m_timer->setSingleShot(true);
        m_timer->setInterval(frameMs);
        m_connection = QObject::connect(m_timer, &QTimer::timeout, m_timer, [this]() { flush(); });
    }

    ~FrameCoalescer()
    {
        QObject::disconnect(m_connection);
        m_timer->stop();
        if (!m_timer->parent()) {
            delete m_timer;
        }
    }

    FrameCoalescer(const FrameCoalescer&) = delete;
    FrameCoalescer& operator=(const FrameCoalescer&) = delete;

    /**
     * @brief Store a value; overwrites any pending one.
     */
    void update(const T& value)
    {
        m_pending = value;
        m_hasPending = true;
        if (!m_timer->isActive()) {
            m_timer->start();
        }
    }

    /**
     * @brief Deliver the pending value now, if any.
     * @return True if a value was delivered.
     */
    bool flush()
    {
        m_timer->stop();
        if (!m_hasPending) {
            return false;
        }
        // Take the value first so the sink may call update() again
        T value = std::move(m_pending);
        m_pending = T();
        m_hasPending = false;
        ++m_deliveries;
        if (m_sink) {
            m_sink(value);
        }
        return true;
    }

    /**
     * @brief Drop the pending value without delivering it.
     */
    void cancel()
    {
        m_timer->stop();
        m_pending = T();
        m_hasPending = false;
    }

    bool hasPending() const { return m_hasPending; }
    const T& pending() const { return m_pending; }
    int frameInterval() const { return m_timer->interval(); }

    /**
     * @brief Number of values delivered so far.
     */
    int deliveryCount() const { return m_deliveries; }

private:
    Sink m_sink;
    QTimer* m_timer = nullptr;
    QMetaObject::Connection m_connection;
    T m_pending{};
    bool m_hasPending = false;
    int m_deliveries = 0;
};
