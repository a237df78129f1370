// Copyright © LaunchFund 2026.
// This file is part of LaunchFund.

#define BOOST_TEST_MODULE launchfund
#include <boost/test/unit_test.hpp>
