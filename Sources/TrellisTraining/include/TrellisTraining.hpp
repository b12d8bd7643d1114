#pragma once

#include "trellis/training/training_plugin.hpp"
