#pragma once

#include "creditkit/creditkit.hpp"
