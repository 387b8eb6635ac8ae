#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <vector>

#include "AudioChunk.hpp"

// Single-producer/single-consumer conduit between the device thread (producer) and the
// coordinating thread (consumer). Lock-free on both sides; the message queue grows in
// fixed-size segments so Send() never waits for the consumer.
class ChunkChannel {
public:
    struct Message {
        enum class Type { Chunk, EndOfStream };

        Type type = Type::Chunk;
        AudioChunk chunk;
    };

    explicit ChunkChannel(size_t recycleCapacity = 8);
    ~ChunkChannel();

    ChunkChannel(const ChunkChannel&) = delete;
    ChunkChannel& operator=(const ChunkChannel&) = delete;

    // Producer side
    void Send(AudioChunk&& chunk);
    void SendEndOfStream();
    bool StopRequested() const { return _stopRequested.load(std::memory_order_acquire); }
    // Returns a previously consumed chunk whose storage can be reused.
    bool TakeRecycled(AudioChunk& chunk);

    // Consumer side
    bool TryReceive(Message& message);
    // Returns true for the first request only.
    bool RequestStop();
    bool EndOfStreamReceived() const { return _endOfStreamReceived; }
    void Recycle(AudioChunk&& chunk);

private:
    static const size_t SEGMENT_SLOTS = 64;

    struct Segment {
        std::array<Message, SEGMENT_SLOTS> slots;
        std::atomic<size_t> committed{0};
        std::atomic<Segment*> next{nullptr};
    };

    void Push(Message&& message);
    Segment* AcquireSegment();
    void RetireSegment(Segment* segment);

    // Producer-owned
    Segment* _tail;
    size_t _tailIndex;

    // Consumer-owned
    Segment* _head;
    size_t _headIndex;
    bool _endOfStreamReceived;

    // One retired segment kept for the producer's next growth step.
    std::atomic<Segment*> _spare;

    std::atomic<bool> _stopRequested;

    // Bounded ring of consumed chunks travelling back to the producer. One slot stays empty
    // to tell full from empty.
    std::vector<AudioChunk> _recycled;
    std::atomic<size_t> _recycleWrite;
    std::atomic<size_t> _recycleRead;
};
