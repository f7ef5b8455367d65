#include "RedisFormatConverter.hpp"

namespace dbbridge {

std::string RedisFormatConverter::toString(const redisReply* reply) {
    if (!reply || !reply->str) return "";
    return std::string(reply->str, reply->len);
}

Value RedisFormatConverter::toValue(const redisReply* reply) {
    if (!reply) {
        return Value(nullptr);
    }

    switch (reply->type) {
        case REDIS_REPLY_NIL:
            return Value(nullptr);

        case REDIS_REPLY_STATUS:
        case REDIS_REPLY_ERROR:
        case REDIS_REPLY_VERB:
        case REDIS_REPLY_BIGNUM:
            return Value(toString(reply));

        case REDIS_REPLY_STRING:
            if (isValidUtf8(reply->str, reply->len)) {
                return Value(toString(reply));
            }
            return Value("<binary data: " + std::to_string(reply->len) + " bytes>");

        case REDIS_REPLY_INTEGER:
            return Value(static_cast<int64_t>(reply->integer));

        case REDIS_REPLY_DOUBLE:
            return Value(reply->dval);

        case REDIS_REPLY_BOOL:
            return Value(reply->integer != 0);

        case REDIS_REPLY_ARRAY:
        case REDIS_REPLY_SET:
        case REDIS_REPLY_PUSH: {
            Value arr = Value::array();
            for (size_t i = 0; i < reply->elements; ++i) {
                arr.push_back(toValue(reply->element[i]));
            }
            return arr;
        }

        case REDIS_REPLY_MAP:
            return pairsToObject(reply);

        default:
            return placeholder("unknown type");
    }
}

Value RedisFormatConverter::pairsToObject(const redisReply* reply) {
    Value obj = Value::object();
    if (!reply) return obj;

    for (size_t i = 0; i + 1 < reply->elements; i += 2) {
        const redisReply* key = reply->element[i];
        Value keyValue = toValue(key);
        std::string name = keyValue.is_string() ? keyValue.get<std::string>() : keyValue.dump();
        obj[name] = toValue(reply->element[i + 1]);
    }
    return obj;
}

Value RedisFormatConverter::scoredMembers(const redisReply* reply) {
    Value pairs = Value::array();
    if (!reply) return pairs;

    auto score = [](const redisReply* r) -> Value {
        if (r->type == REDIS_REPLY_DOUBLE) return Value(r->dval);
        if (auto d = parseDouble(toString(r))) return Value(*d);
        return toValue(r);
    };

    // RESP3 nests each pair; RESP2 returns a flat member/score list
    if (reply->elements > 0 && reply->element[0]->type == REDIS_REPLY_ARRAY) {
        for (size_t i = 0; i < reply->elements; ++i) {
            const redisReply* pair = reply->element[i];
            if (pair->elements < 2) continue;
            pairs.push_back(Value::array({toValue(pair->element[0]), score(pair->element[1])}));
        }
        return pairs;
    }

    for (size_t i = 0; i + 1 < reply->elements; i += 2) {
        pairs.push_back(Value::array({toValue(reply->element[i]), score(reply->element[i + 1])}));
    }
    return pairs;
}

Value RedisFormatConverter::streamEntries(const redisReply* reply) {
    Value entries = Value::array();
    if (!reply) return entries;

    for (size_t i = 0; i < reply->elements; ++i) {
        const redisReply* entry = reply->element[i];
        if (entry->type != REDIS_REPLY_ARRAY || entry->elements < 2) continue;
        entries.push_back({
            {"id", toString(entry->element[0])},
            {"fields", pairsToObject(entry->element[1])},
        });
    }
    return entries;
}

}  // namespace dbbridge
