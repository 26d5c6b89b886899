#pragma once

#include "core/shared/candidate.h"

#include <optional>
#include <vector>

namespace qr {

// Keeps at most cap candidates per source file, preserving order, then
// truncates to topk. Negative cap or topk is rejected with nullopt.
std::optional<std::vector<Candidate>> capPerSource(std::vector<Candidate> candidates,
                                                   int cap,
                                                   int topk);

} // namespace qr
