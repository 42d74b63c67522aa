#pragma once

#include "types/Reports.hpp"

namespace re::concurrency {

using ExpectedFuture = types::FileOutcome;

}
