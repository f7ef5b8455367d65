#pragma once

/**
 * @file RedisFormatConverter.hpp
 * @brief Converts hiredis replies into Values.
 */

#include "FormatConverter.hpp"
#include <hiredis/hiredis.h>

namespace dbbridge {

/**
 * @class RedisFormatConverter
 * @brief Static per-type dispatch from redisReply to Value.
 *
 * | Reply type               | Value                                  |
 * |--------------------------|----------------------------------------|
 * | nil                      | null                                   |
 * | status, verbatim, bignum | string                                 |
 * | string (bulk)            | string, or "<binary data: N bytes>"    |
 * | integer                  | integer                                |
 * | double                   | floating point                         |
 * | bool                     | boolean                                |
 * | array, set, push         | array                                  |
 * | map                      | object (keys rendered as text)         |
 * | error                    | string                                 |
 */
class RedisFormatConverter : public FormatConverter {
public:
    static Value toValue(const redisReply* reply);

    /**
     * @brief Reply text for status, string, error and verbatim replies.
     */
    static std::string toString(const redisReply* reply);

    /**
     * @brief Flat [k1, v1, k2, v2] array or RESP3 map to an object.
     */
    static Value pairsToObject(const redisReply* reply);

    /**
     * @brief ZRANGE ... WITHSCORES reply to [[member, score], ...].
     */
    static Value scoredMembers(const redisReply* reply);

    /**
     * @brief XRANGE reply to [{"id": ..., "fields": {...}}, ...].
     */
    static Value streamEntries(const redisReply* reply);

};

}  // namespace dbbridge
