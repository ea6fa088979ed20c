#pragma once

#define PAGESENV_VERSION "0.1.0"
