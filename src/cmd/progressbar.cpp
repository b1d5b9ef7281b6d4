/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include <iomanip>
#include "progressbar.h"

#include <algorithm>

namespace cmd{

void ProgressBar::update(size_t done, size_t total){
    const float progress = total > 0 ? 100.0f * static_cast<float>(done) / static_cast<float>(total) : 100.0f;
    const unsigned int pos = static_cast<unsigned int>(barWidth * progress / 100.0f);

    const std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now();
    const auto timeElapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - startTime).count();

    std::cout << "Processing files [";

    for (unsigned int i = 0; i < barWidth; ++i) {
        if (i < pos) std::cout << completeChar;
        else std::cout << incompleteChar;
    }

    std::cout << "] " << done << "/" << total << " ";
    if (progress < 10) std::cout << " ";
    std::cout << std::fixed << std::setprecision(2) << progress << "% "
              << std::setprecision(2) << float(timeElapsed) / 1000.0 << "s\r";
    std::cout.flush();
}

void ProgressBar::done() const{
    std::cout << std::endl;
}

}
