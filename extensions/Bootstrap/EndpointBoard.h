/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#ifndef EndpointBoard_H_
#define EndpointBoard_H_
// -------------------------------------------------------------------------
#include <string>
#include <map>
#include <mutex>
#include <future>
// -------------------------------------------------------------------------
namespace ostack
{
    /*!
     * Resolved ports of services, handed from upstream supervisors
     * to their dependants. Every entry is write-once: the first publish()
     * or fail() wins, later calls return false.
     */
    class EndpointBoard
    {
        public:
            EndpointBoard() = default;

            //! create an empty entry (idempotent)
            void declare(const std::string& name);
            bool declared(const std::string& name) const;

            //! service became Healthy on port
            bool publish(const std::string& name, int port);

            //! service reached a non-healthy terminal state
            bool fail(const std::string& name, const std::string& reason);

            //! fail every entry which is not resolved yet (operator abort)
            void abortAll();

            enum class WaitResult
            {
                Ready,
                Failed,
                TimedOut,
                Aborted
            };

            static std::string to_string(WaitResult r);

            /*!
             * Block until the entry is resolved or timeout.
             * \param port resolved port when Ready
             * \param reason error text when Failed or Aborted
             * \throw NameNotFound for an undeclared entry
             */
            WaitResult wait(const std::string& name, size_t timeout_msec, int& port, std::string& reason) const;

            //! resolved port or 0 (does not block)
            int peek(const std::string& name) const;

            //! all healthy entries
            std::map<std::string, int> snapshot() const;

        private:
            struct Entry
            {
                std::promise<int> promise;
                std::shared_future<int> future;
                bool resolved = false;
            };

            bool setException(const std::string& name, std::exception_ptr ex);

            mutable std::mutex mutex_;
            std::map<std::string, Entry> entries_;
    };

} // end of namespace ostack
// -------------------------------------------------------------------------
#endif // EndpointBoard_H_
// -------------------------------------------------------------------------
