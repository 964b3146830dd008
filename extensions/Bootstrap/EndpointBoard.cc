/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#include <chrono>
#include <vector>
#include "EndpointBoard.h"
#include "Exceptions.h"
// -------------------------------------------------------------------------
namespace ostack
{
    // -------------------------------------------------------------------------
    void EndpointBoard::declare(const std::string& name)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (entries_.find(name) != entries_.end())
            return;

        auto& e = entries_[name];
        e.future = e.promise.get_future().share();
    }
    // -------------------------------------------------------------------------
    bool EndpointBoard::declared(const std::string& name) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.find(name) != entries_.end();
    }
    // -------------------------------------------------------------------------
    bool EndpointBoard::publish(const std::string& name, int port)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(name);

        if (it == entries_.end() || it->second.resolved)
            return false;

        it->second.promise.set_value(port);
        it->second.resolved = true;
        return true;
    }
    // -------------------------------------------------------------------------
    bool EndpointBoard::setException(const std::string& name, std::exception_ptr ex)
    {
        auto it = entries_.find(name);

        if (it == entries_.end() || it->second.resolved)
            return false;

        it->second.promise.set_exception(ex);
        it->second.resolved = true;
        return true;
    }
    // -------------------------------------------------------------------------
    bool EndpointBoard::fail(const std::string& name, const std::string& reason)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return setException(name, std::make_exception_ptr(ostack::Exception(reason)));
    }
    // -------------------------------------------------------------------------
    void EndpointBoard::abortAll()
    {
        std::lock_guard<std::mutex> lock(mutex_);

        for (auto& kv : entries_)
            setException(kv.first, std::make_exception_ptr(ostack::Aborted("aborted by operator")));
    }
    // -------------------------------------------------------------------------
    std::string EndpointBoard::to_string(WaitResult r)
    {
        switch (r)
        {
            case WaitResult::Ready:
                return "Ready";

            case WaitResult::Failed:
                return "Failed";

            case WaitResult::TimedOut:
                return "TimedOut";

            case WaitResult::Aborted:
                return "Aborted";
        }

        return "Unknown";
    }
    // -------------------------------------------------------------------------
    EndpointBoard::WaitResult EndpointBoard::wait(const std::string& name, size_t timeout_msec,
            int& port, std::string& reason) const
    {
        std::shared_future<int> f;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(name);

            if (it == entries_.end())
                throw NameNotFound("EndpointBoard: unknown service '" + name + "'");

            f = it->second.future;
        }

        // waiting without the lock: publish() must be able to proceed
        if (f.wait_for(std::chrono::milliseconds(timeout_msec)) != std::future_status::ready)
            return WaitResult::TimedOut;

        try
        {
            port = f.get();
            return WaitResult::Ready;
        }
        catch (const ostack::Aborted& ex)
        {
            reason = ex.what();
            return WaitResult::Aborted;
        }
        catch (const ostack::Exception& ex)
        {
            reason = ex.what();
            return WaitResult::Failed;
        }
    }
    // -------------------------------------------------------------------------
    int EndpointBoard::peek(const std::string& name) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(name);

        if (it == entries_.end() || !it->second.resolved)
            return 0;

        if (it->second.future.wait_for(std::chrono::seconds(0)) != std::future_status::ready)
            return 0;

        try
        {
            return it->second.future.get();
        }
        catch (const ostack::Exception&)
        {
            return 0;
        }
    }
    // -------------------------------------------------------------------------
    std::map<std::string, int> EndpointBoard::snapshot() const
    {
        std::map<std::string, int> result;

        std::vector<std::string> names;
        {
            std::lock_guard<std::mutex> lock(mutex_);

            for (const auto& kv : entries_)
                names.push_back(kv.first);
        }

        for (const auto& n : names)
        {
            int port = peek(n);

            if (port > 0)
                result[n] = port;
        }

        return result;
    }
    // -------------------------------------------------------------------------
} // end of namespace ostack
