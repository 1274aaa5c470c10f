// Copyright (c) rAthena Dev Teams - Licensed under GNU GPL
// For more information, see LICENCE in the main folder
/**
 * @file dispatcher.hpp
 * @brief Decodes inbound lines and fans messages out to handlers
 *
 * Decoding happens on the calling thread (the connection loop) in arrival
 * order. Every handler invocation is a separate task on the worker pool, so
 * handlers for different messages may run in parallel and complete out of
 * order.
 */

#ifndef TPSDK_DISPATCHER_HPP
#define TPSDK_DISPATCHER_HPP

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <common/sync.hpp>

#include "message.hpp"

namespace tpsdk {

/**
 * @brief Message dispatcher
 *
 * Register handlers before the connection starts; the table is read on
 * every dispatch.
 */
class MessageDispatcher {
public:
    /// Runs on the dispatching thread before any handler is queued
    using InboundHook = std::function<void(const Message&)>;

    /**
     * @param pool Worker pool running the handlers
     * @param plugin_id Local plugin id
     * @param check_plugin_id Reject messages carrying another plugin's id
     */
    MessageDispatcher(thread_pool& pool, std::string plugin_id, bool check_plugin_id);

    /**
     * @brief Register a handler for one message kind
     *
     * Handlers of the same kind are queued in registration order.
     */
    void on(MessageKind kind, MessageHandler handler);

    /**
     * @brief Register a handler receiving every decoded message
     */
    void on_any(MessageHandler handler);

    /**
     * @brief Register a handler for asynchronous failures
     */
    void on_error(ErrorHandler handler);

    void set_inbound_hook(InboundHook hook);

    /**
     * @brief Decode one line and dispatch it
     *
     * A line that does not decode to an object with a string `type` is
     * reported as a protocol error and dropped.
     */
    void dispatch_line(const std::string& line);

    /**
     * @brief Queue the handlers of an already decoded message
     */
    void dispatch(const Message& message);

    /**
     * @brief Log a failure and call every error handler on this thread
     */
    void raise_error(ErrorEvent event);

    size_t handler_count(MessageKind kind) const;
    size_t any_handler_count() const;
    size_t error_handler_count() const;

private:
    void submit(const MessageHandler& handler, const std::shared_ptr<const Message>& message);

    thread_pool& pool_;
    const std::string plugin_id_;
    const bool check_plugin_id_;

    mutable std::mutex mutex_;
    std::map<MessageKind, std::vector<MessageHandler>> handlers_;
    std::vector<MessageHandler> any_handlers_;
    std::vector<ErrorHandler> error_handlers_;
    InboundHook inbound_hook_;
};

} // namespace tpsdk

#endif // TPSDK_DISPATCHER_HPP
