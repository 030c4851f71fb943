#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

#include "stream_event.hpp"

namespace sidecar {

using NotificationListener = std::function<void(const NotificationEvent&)>;

/**
 * EventRelay - 把 NotificationEvent 转发给 GUI 边界的监听者
 *
 * 尽力而为：没有监听者时事件直接丢弃；不确认、不重试、不缓冲。
 * 监听者在锁外按订阅顺序被调用，事件按 emit 顺序送达。
 */
class EventRelay {
public:
    using ListenerId = uint64_t;

    EventRelay() = default;

    // 禁止拷贝
    EventRelay(const EventRelay&) = delete;
    EventRelay& operator=(const EventRelay&) = delete;

    /**
     * 注册监听者
     * @return 用于 unsubscribe 的 id
     */
    ListenerId subscribe(NotificationListener listener);

    /**
     * 注销监听者
     * @return 是否找到并移除
     */
    bool unsubscribe(ListenerId id);

    /**
     * 发送通知
     * @return 成功送达的监听者数量
     */
    size_t emit(const NotificationEvent& event);

    size_t listener_count() const;

private:
    mutable std::mutex mutex_;
    ListenerId next_id_ = 1;
    std::vector<std::pair<ListenerId, NotificationListener>> listeners_;
};

} // namespace sidecar
