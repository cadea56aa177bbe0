#ifndef BLOCK_DIGEST_HPP_
#define BLOCK_DIGEST_HPP_

#include <array>
#include <cstdint>
#include <vector>

typedef std::array<char, 4> engine_id_t;

// proof of scan consensus engine, its pre-runtime item carries the author
static constexpr engine_id_t POSCAN_ENGINE_ID = {'p', 's', 'c', 'n'};

enum class DigestItemType
{
    PRE_RUNTIME,
    CONSENSUS,
    SEAL,
    OTHER
};

struct DigestItem
{
    DigestItemType type;
    engine_id_t engine_id;
    std::vector<uint8_t> data;
};

struct BlockDigest
{
    std::vector<DigestItem> logs;
};

#endif
