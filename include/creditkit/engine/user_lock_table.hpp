#pragma once

#include <algorithm>
#include <chrono>
#include <creditkit/common/error.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace creditkit {

    /// Per-user write locks. Entries exist only while someone holds or waits
    /// for them. Several users are always locked in sorted order.
    class UserLockTable {
        struct Entry {
            std::timed_mutex mutex;
            dp::u32 refs{0};
        };

      public:
        /// Holds the locks of one or more users until destroyed
        class Guard {
          public:
            Guard() = default;
            inline Guard(UserLockTable *table, std::vector<std::pair<std::string, std::shared_ptr<Entry>>> held)
                : table_(table), held_(std::move(held)) {}
            inline ~Guard() { release(); }

            Guard(const Guard &) = delete;
            Guard &operator=(const Guard &) = delete;

            inline Guard(Guard &&other) noexcept : table_(other.table_), held_(std::move(other.held_)) {
                other.table_ = nullptr;
                other.held_.clear();
            }
            inline Guard &operator=(Guard &&other) noexcept {
                if (this != &other) {
                    release();
                    table_ = other.table_;
                    held_ = std::move(other.held_);
                    other.table_ = nullptr;
                    other.held_.clear();
                }
                return *this;
            }

            inline size_t size() const { return held_.size(); }

          private:
            inline void release() {
                if (!table_)
                    return;
                for (auto it = held_.rbegin(); it != held_.rend(); ++it) {
                    it->second->mutex.unlock();
                    table_->unref(it->first);
                }
                held_.clear();
                table_ = nullptr;
            }

            UserLockTable *table_ = nullptr;
            std::vector<std::pair<std::string, std::shared_ptr<Entry>>> held_;
        };

        /// Lock every listed user, waiting at most `timeout_ms` for each
        inline dp::Result<Guard, dp::Error> lock(std::vector<std::string> user_ids, dp::i64 timeout_ms) {
            std::sort(user_ids.begin(), user_ids.end());
            user_ids.erase(std::unique(user_ids.begin(), user_ids.end()), user_ids.end());

            std::vector<std::pair<std::string, std::shared_ptr<Entry>>> held;
            for (const auto &user : user_ids) {
                auto entry = ref(user);
                if (!entry->mutex.try_lock_for(std::chrono::milliseconds(timeout_ms))) {
                    unref(user);
                    Guard partial(this, std::move(held)); // unlocks what was taken
                    return dp::Result<Guard, dp::Error>::err(
                        storage_timeout("Timed out waiting for write lock on user " + user));
                }
                held.emplace_back(user, std::move(entry));
            }
            return dp::Result<Guard, dp::Error>::ok(Guard(this, std::move(held)));
        }

        /// Users currently locked or awaited
        inline size_t activeEntries() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return entries_.size();
        }

      private:
        inline std::shared_ptr<Entry> ref(const std::string &user) {
            std::lock_guard<std::mutex> lock(mutex_);
            auto &entry = entries_[user];
            if (!entry)
                entry = std::make_shared<Entry>();
            ++entry->refs;
            return entry;
        }

        inline void unref(const std::string &user) {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(user);
            if (it == entries_.end())
                return;
            if (--it->second->refs == 0)
                entries_.erase(it);
        }

        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
    };

} // namespace creditkit
