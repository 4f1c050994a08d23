#ifndef AGENTSIG_TEST_LOG_HEADER
#define AGENTSIG_TEST_LOG_HEADER

#include "agentsig/common/logger.hpp"

namespace agentsig::test {

stdout_logger& test_log();

}

#endif
