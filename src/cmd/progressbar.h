/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef PROGRESSBAR_H
#define PROGRESSBAR_H

#include <iostream>
#include <chrono>
#include <string>

namespace cmd{

// Single line console bar, redrawn in place
class ProgressBar {
private:
    const unsigned int barWidth;
    const char completeChar = '#';
    const char incompleteChar = '-';
    const std::chrono::steady_clock::time_point startTime = std::chrono::steady_clock::now();

public:
    ProgressBar() : barWidth(40) {}
    ProgressBar(unsigned int width) :
                barWidth(width) {}

    void update(size_t done, size_t total);
    void done() const;
};

}

#endif // PROGRESSBAR_H
