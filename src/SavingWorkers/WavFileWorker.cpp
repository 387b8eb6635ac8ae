#include "WavFileWorker.hpp"
#include "../common/debug_log.hpp"

#include <fstream>

bool WavFileWorker::Save() {
    if (!_clip) {
        throw SavingWorkerException("A clip must be set before saving");
    }

    const std::vector<uint8_t>& bytes = _clip->GetBytes();
    std::ofstream outfile(_filename, std::ios::binary | std::ios::trunc);
    if (!outfile) {
        ERROR_LOG("Could not open output file: " << _filename);
        return false;
    }

    outfile.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    outfile.close();
    if (!outfile) {
        ERROR_LOG("Error writing " << bytes.size() << " bytes to " << _filename);
        return false;
    }

    DEBUG_LOG("Successfully saved " << _clip->GetFrameCount() << " frames ("
              << _clip->GetDurationSeconds() << "s) to " << _filename << DEBUG_LOG_ENDL);
    return true;
}
