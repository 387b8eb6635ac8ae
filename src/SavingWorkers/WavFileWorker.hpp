#pragma once

#include <string>
#include <utility>

#include "ISavingWorker.hpp"

class WavFileWorker : public ISavingWorker {
public:
    explicit WavFileWorker(std::string filename) : _filename(std::move(filename)) {}

    bool Save() override;

private:
    std::string _filename;
};
