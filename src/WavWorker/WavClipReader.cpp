#include "WavClipReader.hpp"
#include "../common/Exceptions.hpp"
#include "../common/debug_log.hpp"
#include "sndfile.h"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <string>

namespace {

struct MemoryFile {
    const std::vector<uint8_t>* bytes;
    sf_count_t position;
};

sf_count_t MemoryGetLength(void* userData) {
    return static_cast<sf_count_t>(static_cast<MemoryFile*>(userData)->bytes->size());
}

sf_count_t MemorySeek(sf_count_t offset, int whence, void* userData) {
    MemoryFile* file = static_cast<MemoryFile*>(userData);
    const sf_count_t size = static_cast<sf_count_t>(file->bytes->size());
    sf_count_t target = offset;
    if (whence == SEEK_CUR) {
        target = file->position + offset;
    } else if (whence == SEEK_END) {
        target = size + offset;
    }
    file->position = std::max<sf_count_t>(0, std::min(target, size));
    return file->position;
}

sf_count_t MemoryRead(void* ptr, sf_count_t count, void* userData) {
    MemoryFile* file = static_cast<MemoryFile*>(userData);
    const sf_count_t size = static_cast<sf_count_t>(file->bytes->size());
    const sf_count_t available = std::max<sf_count_t>(0, size - file->position);
    const sf_count_t toRead = std::min(count, available);
    if (toRead > 0) {
        std::memcpy(ptr, file->bytes->data() + file->position, static_cast<size_t>(toRead));
        file->position += toRead;
    }
    return toRead;
}

sf_count_t MemoryWrite(const void*, sf_count_t, void*) {
    return 0;
}

sf_count_t MemoryTell(void* userData) {
    return static_cast<MemoryFile*>(userData)->position;
}

} // namespace

DecodedClip ReadWavClip(const std::vector<uint8_t>& bytes) {
    SF_VIRTUAL_IO io;
    io.get_filelen = &MemoryGetLength;
    io.seek = &MemorySeek;
    io.read = &MemoryRead;
    io.write = &MemoryWrite;
    io.tell = &MemoryTell;

    MemoryFile file{&bytes, 0};
    SF_INFO sfinfo;
    std::memset(&sfinfo, 0, sizeof(sfinfo));

    SNDFILE* infile = sf_open_virtual(&io, SFM_READ, &sfinfo, &file);
    if (!infile) {
        throw WavFormatException(std::string("Could not decode WAV: ") + sf_strerror(nullptr));
    }

    DecodedClip clip;
    clip.sampleRate = static_cast<unsigned int>(sfinfo.samplerate);
    clip.channels = static_cast<unsigned int>(sfinfo.channels);
    clip.samples.resize(static_cast<size_t>(sfinfo.frames) * clip.channels);

    const sf_count_t framesRead = sf_readf_float(infile, clip.samples.data(), sfinfo.frames);
    sf_close(infile);

    if (framesRead != sfinfo.frames) {
        throw WavFormatException("Read " + std::to_string(framesRead) + " frames, expected "
                                 + std::to_string(sfinfo.frames));
    }

    DEBUG_LOG("Decoded WAV clip: " << clip.channels << " ch, " << clip.sampleRate << " Hz, "
              << framesRead << " frames" << DEBUG_LOG_ENDL);
    return clip;
}
