#pragma once

#include "Golden.hpp"
#include "GoldenOptions.hpp"
#include "compare/ComparisonEngine.hpp"
#include "compare/Normalizer.hpp"
#include "core/Error.hpp"
#include "diff/DiffEngine.hpp"
#include "diff/DiffRenderer.hpp"
#include "diff/LineSplitter.hpp"
#include "format/CallerIdentity.hpp"
#include "format/ValueFormatter.hpp"
#include "store/KeyedFileStore.hpp"
#include "store/NamingStrategy.hpp"
