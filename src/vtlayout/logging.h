// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <crispy/logstore.h>

namespace vtlayout
{

auto const inline geometryLog = logstore::category("layout.geometry", "Logs content bounds computations.");
auto const inline resizeLog =
    logstore::category("layout.resize", "Logs resize coordination (grid size vs. window frame).");
auto const inline chromeLog = logstore::category("layout.chrome", "Logs title bar and tab bar inset changes.");
auto const inline scrollLog = logstore::category("layout.scroll", "Logs the auto-hiding scroll indicator.");
auto const inline oscillatorLog =
    logstore::category("layout.oscillator", "Logs the continuous resize driver.");

} // namespace vtlayout
