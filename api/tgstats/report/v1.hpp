#pragma once

#include "tgstats/report/v1/word_count.pb.h"
