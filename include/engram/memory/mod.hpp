#pragma once

#include "engram/memory/duplicate_detector.hpp"
#include "engram/memory/embedder.hpp"
#include "engram/memory/embedder_local.hpp"
#include "engram/memory/embedder_openai.hpp"
#include "engram/memory/embedding_provider.hpp"
#include "engram/memory/hybrid_ranker.hpp"
#include "engram/memory/memory.hpp"
#include "engram/memory/similarity.hpp"
#include "engram/memory/sqlite_store.hpp"
