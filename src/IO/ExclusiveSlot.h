#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

namespace AsyncFile::Core::IO {

/**
 * @brief Idle/Busy holder for the resource an open file operates on
 *
 * Each operation on an open file checks the resource out with tryCheckOut()
 * and holds the returned Lease for the duration of the work. While a lease
 * exists the slot is Busy and further check-outs fail. Destroying the lease
 * (or calling checkIn()) puts the resource back and returns the slot to Idle.
 *
 * Leases keep the slot alive, so a lease captured by scheduled work stays
 * valid even if every handle to the file has been dropped; the resource is
 * destroyed with the last of them.
 *
 * @code
 * auto slot = ExclusiveSlot<uint64_t>::create(0);
 * if (auto lease = slot->tryCheckOut()) {
 *     **lease += 16;
 * } // checked back in here
 * @endcode
 */
template <typename T>
class ExclusiveSlot : public std::enable_shared_from_this<ExclusiveSlot<T>> {
public:
    enum class State : uint8_t { Idle, Busy };

    class Lease {
    public:
        Lease() = default;
        Lease(Lease&& other) noexcept : _slot(std::move(other._slot)), _value(std::move(other._value)) {
            other._slot.reset();
            other._value.reset();
        }
        Lease& operator=(Lease&& other) noexcept {
            if (this != &other) {
                checkIn();
                _slot = std::move(other._slot);
                _value = std::move(other._value);
                other._slot.reset();
                other._value.reset();
            }
            return *this;
        }
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        ~Lease() { checkIn(); }

        T& operator*() noexcept { return *_value; }
        const T& operator*() const noexcept { return *_value; }
        T* operator->() noexcept { return &*_value; }

        bool held() const noexcept { return _slot != nullptr; }

        void checkIn() noexcept {
            if (_slot) {
                _slot->restore(std::move(*_value));
                _slot.reset();
                _value.reset();
            }
        }

    private:
        friend class ExclusiveSlot;
        Lease(std::shared_ptr<ExclusiveSlot> slot, T value)
            : _slot(std::move(slot)), _value(std::move(value)) {}

        std::shared_ptr<ExclusiveSlot> _slot;
        std::optional<T> _value;
    };

    static std::shared_ptr<ExclusiveSlot> create(T value) {
        return std::shared_ptr<ExclusiveSlot>(new ExclusiveSlot(std::move(value)));
    }

    // Empty when another lease is outstanding
    std::optional<Lease> tryCheckOut() {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_state == State::Busy) return std::nullopt;
        _state = State::Busy;
        T value = std::move(*_value);
        _value.reset();
        return Lease(this->shared_from_this(), std::move(value));
    }

    State state() const noexcept {
        std::lock_guard<std::mutex> lock(_mutex);
        return _state;
    }

    bool busy() const noexcept { return state() == State::Busy; }

private:
    explicit ExclusiveSlot(T value) : _value(std::move(value)) {}

    void restore(T value) noexcept {
        std::lock_guard<std::mutex> lock(_mutex);
        _value = std::move(value);
        _state = State::Idle;
    }

    mutable std::mutex _mutex;
    State _state = State::Idle;
    std::optional<T> _value;
};

} // namespace AsyncFile::Core::IO
