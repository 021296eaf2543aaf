#pragma once

#include <cstddef>
#include <utility>
#include <vector>

namespace NRelay {

/**
 * @brief FIFO ring buffer over a single vector, grown by doubling.
 *
 * Backing store for mailboxes and wait lists. Power-of-two capacity keeps the
 * index arithmetic to a mask. The element type must be default constructible
 * and movable; popped slots are reset to T{} so they release what they held.
 */
template<typename T>
class TRingQueue {
public:
    explicit TRingQueue(size_t capacity = 16)
        : Data(RoundUpToPowerOfTwo(capacity))
        , LastIndex(Data.size() - 1)
    { }

    void Push(T&& item) {
        EnsureCapacity();
        Data[Tail] = std::move(item);
        Tail = (Tail + 1) & LastIndex;
    }

    T& Front() {
        return Data[Head];
    }

    void Pop() {
        Data[Head] = T{};
        Head = (Head + 1) & LastIndex;
    }

    bool TryPop(T& item) {
        if (Empty()) {
            return false;
        }
        item = std::move(Data[Head]);
        Pop();
        return true;
    }

    size_t Size() const {
        return (Data.size() + Tail - Head) & LastIndex;
    }

    bool Empty() const {
        return Head == Tail;
    }

    void Clear() {
        while (!Empty()) {
            Pop();
        }
    }

private:
    static size_t RoundUpToPowerOfTwo(size_t value) {
        size_t power = 2;
        while (power < value) {
            power <<= 1;
        }
        return power;
    }

    void EnsureCapacity() {
        if (Size() == Data.size() - 1) [[unlikely]] {
            std::vector<T> newData(Data.size() * 2);
            auto size = Size();
            for (size_t i = 0; i < size; ++i) {
                newData[i] = std::move(Data[(Head + i) & LastIndex]);
            }
            Data = std::move(newData);
            Head = 0;
            Tail = size;
            LastIndex = Data.size() - 1;
        }
    }

    std::vector<T> Data;
    size_t Head = 0;
    size_t Tail = 0;
    size_t LastIndex = 0;
};

} // namespace NRelay
