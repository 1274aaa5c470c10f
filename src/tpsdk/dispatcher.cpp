// Copyright (c) rAthena Dev Teams - Licensed under GNU GPL
// For more information, see LICENCE in the main folder

#include "dispatcher.hpp"

#include <common/showmsg.hpp>

namespace tpsdk {

MessageDispatcher::MessageDispatcher(thread_pool& pool, std::string plugin_id, bool check_plugin_id)
    : pool_(pool), plugin_id_(std::move(plugin_id)), check_plugin_id_(check_plugin_id) {
}

// ============================================================================
// Registration
// ============================================================================

void MessageDispatcher::on(MessageKind kind, MessageHandler handler) {
    if (!handler) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_[kind].push_back(std::move(handler));
}

void MessageDispatcher::on_any(MessageHandler handler) {
    if (!handler) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    any_handlers_.push_back(std::move(handler));
}

void MessageDispatcher::on_error(ErrorHandler handler) {
    if (!handler) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    error_handlers_.push_back(std::move(handler));
}

void MessageDispatcher::set_inbound_hook(InboundHook hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    inbound_hook_ = std::move(hook);
}

size_t MessageDispatcher::handler_count(MessageKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(kind);
    return it != handlers_.end() ? it->second.size() : 0;
}

size_t MessageDispatcher::any_handler_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return any_handlers_.size();
}

size_t MessageDispatcher::error_handler_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_handlers_.size();
}

// ============================================================================
// Dispatch
// ============================================================================

void MessageDispatcher::dispatch_line(const std::string& line) {
    nlohmann::json data;
    try {
        data = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        raise_error({ErrorCategory::PROTOCOL, std::string("Invalid JSON: ") + e.what(), line, std::current_exception()});
        return;
    }

    if (!data.is_object()) {
        raise_error({ErrorCategory::PROTOCOL, std::string("Message is not an object but ") + data.type_name(), line, nullptr});
        return;
    }

    auto type_it = data.find("type");
    if (type_it == data.end() || !type_it->is_string()) {
        raise_error({ErrorCategory::PROTOCOL, "Message has no type", line, nullptr});
        return;
    }

    Message message;
    message.type = type_it->get<std::string>();
    message.kind = message_kind_from_type(message.type);
    message.data = std::move(data);

    if (check_plugin_id_) {
        std::string plugin_id = message.plugin_id();
        if (!plugin_id.empty() && plugin_id != plugin_id_) {
            raise_error({ErrorCategory::PLUGIN_ID,
                         "Message '" + message.type + "' is addressed to plugin '" + plugin_id + "'", line, nullptr});
            return;
        }
    }

    if (message.kind == MessageKind::UNKNOWN) {
        ShowDebug("[MessageDispatcher] Unknown message type '%s'\n", message.type.c_str());
    }

    InboundHook hook;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        hook = inbound_hook_;
    }
    if (hook) {
        try {
            hook(message);
        } catch (const std::exception& e) {
            raise_error({ErrorCategory::HANDLER, std::string("Inbound processing failed: ") + e.what(), line, std::current_exception()});
        } catch (...) {
            raise_error({ErrorCategory::HANDLER, "Inbound processing failed with a non-standard exception", line, std::current_exception()});
        }
    }

    dispatch(message);
}

void MessageDispatcher::dispatch(const Message& message) {
    std::vector<MessageHandler> handlers;
    std::vector<MessageHandler> any_handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(message.kind);
        if (it != handlers_.end()) {
            handlers = it->second;
        }
        any_handlers = any_handlers_;
    }

    auto shared = std::make_shared<const Message>(message);
    for (const auto& handler : handlers) {
        submit(handler, shared);
    }
    for (const auto& handler : any_handlers) {
        submit(handler, shared);
    }
}

void MessageDispatcher::submit(const MessageHandler& handler, const std::shared_ptr<const Message>& message) {
    bool queued = pool_.post([this, handler, message]() {
        try {
            handler(*message);
        } catch (const std::exception& e) {
            raise_error({ErrorCategory::HANDLER,
                         "Handler for '" + message->type + "' failed: " + e.what(),
                         message->data.dump(), std::current_exception()});
        } catch (...) {
            raise_error({ErrorCategory::HANDLER,
                         "Handler for '" + message->type + "' failed with a non-standard exception",
                         message->data.dump(), std::current_exception()});
        }
    });

    if (!queued) {
        ShowWarning("[MessageDispatcher] Worker pool stopped, '%s' message not delivered\n", message->type.c_str());
    }
}

void MessageDispatcher::raise_error(ErrorEvent event) {
    if (event.category == ErrorCategory::PROTOCOL || event.category == ErrorCategory::PLUGIN_ID) {
        ShowWarning("[MessageDispatcher] %s error: %s\n", error_category_name(event.category), event.message.c_str());
    } else {
        ShowError("[MessageDispatcher] %s error: %s\n", error_category_name(event.category), event.message.c_str());
    }

    std::vector<ErrorHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers = error_handlers_;
    }

    for (const auto& handler : handlers) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            ShowError("[MessageDispatcher] Error handler failed: %s\n", e.what());
        } catch (...) {
            ShowError("[MessageDispatcher] Error handler failed with a non-standard exception\n");
        }
    }
}

} // namespace tpsdk
