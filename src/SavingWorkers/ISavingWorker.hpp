#pragma once

#include <optional>

#include "../WavWorker/EncodedClip.hpp"
#include "../common/Exceptions.hpp"

class SavingWorkerException : public DubCaptureException {
public:
    using DubCaptureException::DubCaptureException;
};

// Hands a finished clip to whatever stores or uploads it.
class ISavingWorker {
public:
    virtual ~ISavingWorker() = default;

    void SetClip(const EncodedClip& clip) { _clip = clip; }
    bool HasClip() const { return _clip.has_value(); }

    virtual bool Save() = 0;

protected:
    std::optional<EncodedClip> _clip;
};
