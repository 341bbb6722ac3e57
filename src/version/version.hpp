#pragma once

#define CTESTGEN_VERSION "ctestgen Version 1.0.0 -- 19 October 2026"
