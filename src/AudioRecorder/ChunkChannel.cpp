#include "ChunkChannel.hpp"

#include <utility>

ChunkChannel::ChunkChannel(size_t recycleCapacity)
    : _tail(new Segment())
    , _tailIndex(0)
    , _head(_tail)
    , _headIndex(0)
    , _endOfStreamReceived(false)
    , _spare(nullptr)
    , _stopRequested(false)
    , _recycled(recycleCapacity + 1)
    , _recycleWrite(0)
    , _recycleRead(0) {
}

ChunkChannel::~ChunkChannel() {
    Segment* segment = _head;
    while (segment) {
        Segment* next = segment->next.load(std::memory_order_relaxed);
        delete segment;
        segment = next;
    }
    delete _spare.load(std::memory_order_relaxed);
}

void ChunkChannel::Send(AudioChunk&& chunk) {
    Message message;
    message.type = Message::Type::Chunk;
    message.chunk = std::move(chunk);
    Push(std::move(message));
}

void ChunkChannel::SendEndOfStream() {
    Message message;
    message.type = Message::Type::EndOfStream;
    Push(std::move(message));
}

void ChunkChannel::Push(Message&& message) {
    if (_tailIndex == SEGMENT_SLOTS) {
        Segment* segment = AcquireSegment();
        _tail->next.store(segment, std::memory_order_release);
        _tail = segment;
        _tailIndex = 0;
    }

    _tail->slots[_tailIndex] = std::move(message);
    ++_tailIndex;
    // Release makes the slot contents visible before the consumer sees the new count.
    _tail->committed.store(_tailIndex, std::memory_order_release);
}

ChunkChannel::Segment* ChunkChannel::AcquireSegment() {
    Segment* segment = _spare.exchange(nullptr, std::memory_order_acquire);
    if (segment) {
        return segment;
    }
    return new Segment();
}

void ChunkChannel::RetireSegment(Segment* segment) {
    segment->committed.store(0, std::memory_order_relaxed);
    segment->next.store(nullptr, std::memory_order_relaxed);
    delete _spare.exchange(segment, std::memory_order_acq_rel);
}

bool ChunkChannel::TryReceive(Message& message) {
    for (;;) {
        const size_t committed = _head->committed.load(std::memory_order_acquire);
        if (_headIndex < committed) {
            message = std::move(_head->slots[_headIndex]);
            ++_headIndex;
            if (message.type == Message::Type::EndOfStream) {
                _endOfStreamReceived = true;
            }
            return true;
        }

        if (_headIndex < SEGMENT_SLOTS) {
            return false;
        }

        // Current segment fully consumed; the producer links the next one before writing to it.
        Segment* next = _head->next.load(std::memory_order_acquire);
        if (!next) {
            return false;
        }
        Segment* done = _head;
        _head = next;
        _headIndex = 0;
        RetireSegment(done);
    }
}

bool ChunkChannel::RequestStop() {
    return !_stopRequested.exchange(true, std::memory_order_acq_rel);
}

void ChunkChannel::Recycle(AudioChunk&& chunk) {
    const size_t writeIdx = _recycleWrite.load(std::memory_order_relaxed);
    const size_t readIdx = _recycleRead.load(std::memory_order_acquire);
    const size_t nextWrite = (writeIdx + 1) % _recycled.size();
    if (nextWrite == readIdx) {
        // Ring full; the storage is simply freed.
        return;
    }
    _recycled[writeIdx] = std::move(chunk);
    _recycleWrite.store(nextWrite, std::memory_order_release);
}

bool ChunkChannel::TakeRecycled(AudioChunk& chunk) {
    const size_t readIdx = _recycleRead.load(std::memory_order_relaxed);
    const size_t writeIdx = _recycleWrite.load(std::memory_order_acquire);
    if (readIdx == writeIdx) {
        return false;
    }
    chunk = std::move(_recycled[readIdx]);
    _recycleRead.store((readIdx + 1) % _recycled.size(), std::memory_order_release);
    return true;
}
