#pragma once

#include "vault/vault_key.hpp"

#include <atomic>
#include <exception>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace vault {

class LockError : public std::runtime_error {
public:
    explicit LockError(const std::string& msg) : std::runtime_error(msg) {}
};

class PoisonedError : public LockError {
    using LockError::LockError;
};

/*
 * Thread-safe container that hands out a VaultKey for every stored value.
 *
 * One mutex guards the whole map. Every public operation holds it for its
 * full duration, so each call is atomic with respect to all others.
 *
 * Lock failures are fatal:
 *  - calling back into the vault from inside update_item throws LockError
 *  - an exception escaping while the lock is held poisons the vault, and
 *    every later call throws PoisonedError
 */
template <typename T>
class Vault {
public:
    using value_type = T;

    Vault() = default;

    // Reserve buckets up front
    explicit Vault(size_t initial_capacity) {
        items_.reserve(initial_capacity);
    }

    ~Vault() = default;

    // Owns a mutex, neither copyable nor movable
    Vault(const Vault&) = delete;
    Vault& operator=(const Vault&) = delete;
    Vault(Vault&&) = delete;
    Vault& operator=(Vault&&) = delete;

    // Store value under a fresh key and return the key
    VaultKey add(T value) {
        Guard guard(*this);
        for (;;) {
            // A collision is practically impossible, but never overwrite
            VaultKey key = VaultKey::generate();
            if (insert_absent(key, value))
                return key;
        }
    }

    // Store value under key unless key is taken.
    // Returns false (and keeps the old value) on collision.
    bool add_with_key(T value, const VaultKey& key) {
        Guard guard(*this);
        return insert_absent(key, value);
    }

    // Take the value out of the vault, std::nullopt if key is unknown
    std::optional<T> remove(const VaultKey& key) {
        Guard guard(*this);
        auto node = items_.extract(key);
        if (node.empty())
            return std::nullopt;
        return std::optional<T>{std::move(node.mapped())};
    }

    bool has_item(const VaultKey& key) const {
        Guard guard(*this);
        return items_.find(key) != items_.end();
    }

    /*
     * Replace the value stored under key.
     *
     * operation is either a transform, T(T&&) or T(T&), whose result becomes
     * the new value, or a mutator, void(T&), that edits the value in place.
     * The value is taken out, changed and put back under the same key
     * inside one lock scope.
     *
     * Returns false and does nothing if key is unknown.
     * If operation throws, the entry is lost and the vault is poisoned.
     */
    template <typename F>
    bool update_item(const VaultKey& key, F&& operation) {
        Guard guard(*this);
        auto node = items_.extract(key);
        if (node.empty())
            return false;

        if constexpr (std::is_invocable_r_v<T, F&, T&&>) {
            T updated = std::invoke(operation, std::move(node.mapped()));
            return insert_absent(key, updated);
        } else {
            static_assert(std::is_invocable_v<F&, T&>,
                "update_item expects a T(T&&) or T(T&) transform, or a void(T&) mutator");
            using Result = std::invoke_result_t<F&, T&>;

            if constexpr (std::is_void_v<Result>) {
                std::invoke(operation, node.mapped());
            } else {
                // T(T&) transform, its result replaces the value
                static_assert(std::is_convertible_v<Result, T>,
                    "update_item transform must return something convertible to T");
                T updated = std::invoke(operation, node.mapped());
                node.mapped() = std::move(updated);
            }
            return insert_absent(key, node.mapped());
        }
    }

    // Destroy every stored value
    void clear() {
        Guard guard(*this);
        items_.clear();
    }

    size_t size() const {
        Guard guard(*this);
        return items_.size();
    }

    bool empty() const {
        Guard guard(*this);
        return items_.empty();
    }

    // Reads the flag without taking the lock
    bool poisoned() const noexcept {
        return poisoned_.load(std::memory_order_acquire);
    }

private:
    /*
     * RAII scope for the vault mutex.
     * Rejects re-entry from the owning thread before blocking on the mutex,
     * and poisons the vault if it is destroyed by an in-flight exception.
     */
    class Guard {
    public:
        explicit Guard(const Vault& vault) : vault_(vault) {
            if (vault_.owner_.load(std::memory_order_acquire) == std::this_thread::get_id())
                throw LockError{"re-entrant vault access while holding its lock"};

            try {
                vault_.mutex_.lock();
            } catch (const std::system_error& e) {
                throw LockError{std::string{"failed to lock vault: "} + e.what()};
            }

            if (vault_.poisoned_.load(std::memory_order_acquire)) {
                vault_.mutex_.unlock();
                throw PoisonedError{"vault is poisoned by an earlier failed operation"};
            }

            vault_.owner_.store(std::this_thread::get_id(), std::memory_order_release);
            uncaught_ = std::uncaught_exceptions();
        }

        ~Guard() {
            if (std::uncaught_exceptions() > uncaught_)
                vault_.poison();
            vault_.owner_.store(std::thread::id{}, std::memory_order_release);
            vault_.mutex_.unlock();
        }

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        const Vault& vault_;
        int uncaught_{0};
    };

    // Shared insertion path, the caller must hold the lock.
    // Moves from value only when the key was absent.
    bool insert_absent(const VaultKey& key, T& value) {
        return items_.try_emplace(key, std::move(value)).second;
    }

    void poison() const noexcept {
        if (!poisoned_.exchange(true, std::memory_order_acq_rel))
            std::cerr << "[Vault] poisoned: an operation failed while holding the lock\n";
    }

    std::unordered_map<VaultKey, T> items_;
    mutable std::mutex mutex_;
    mutable std::atomic<std::thread::id> owner_{};
    mutable std::atomic<bool> poisoned_{false};
};

} // namespace vault
