/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef BLUESKY_KAFKA_CODEC_HPP
#define BLUESKY_KAFKA_CODEC_HPP

#include <bluesky_kafka/ForwardDcl.hpp>
#include <bluesky_kafka/Exception.hpp>
#include <bluesky_kafka/Factory.hpp>
#include <bluesky_kafka/Json.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace bluesky_kafka {

/**
 * @brief The CodecInterface class provides an interface for
 * converting a document into the bytes of a Kafka message
 * and back.
 *
 * Implementations must satisfy decode(encode(d)) == d for every
 * document d their format can represent.
 */
class CodecInterface {

    public:

    /**
     * @brief Destructor.
     */
    virtual ~CodecInterface() = default;

    /**
     * @brief Name under which the codec is registered.
     */
    virtual std::string name() const = 0;

    /**
     * @brief Encode a document into bytes.
     * Errors should be handled by throwing a bluesky_kafka::Exception.
     *
     * @param document Document to encode.
     *
     * @return the encoded bytes.
     */
    virtual std::vector<char> encode(const nlohmann::json& document) const = 0;

    /**
     * @brief Decode a document from bytes.
     * Malformed input must be reported by throwing a
     * bluesky_kafka::DecodeError.
     *
     * @param bytes Bytes to decode.
     *
     * @return the decoded document.
     */
    virtual nlohmann::json decode(std::string_view bytes) const = 0;

    /**
     * @note A CodecInterface class must also provide a static create
     * function with the following prototype to be registered with
     * BLUESKY_KAFKA_REGISTER_CODEC:
     *
     * static std::unique_ptr<CodecInterface> create();
     */
};

class Codec {

    public:

    /**
     * @brief Constructor. Will construct a valid Codec that
     * encodes documents with MessagePack.
     */
    Codec();

    /**
     * @brief Constructor from an existing implementation.
     */
    Codec(const std::shared_ptr<CodecInterface>& impl);

    /**
     * @brief Copy-constructor.
     */
    Codec(const Codec&);

    /**
     * @brief Move-constructor.
     */
    Codec(Codec&&);

    /**
     * @brief copy-assignment operator.
     */
    Codec& operator=(const Codec&);

    /**
     * @brief Move-assignment operator.
     */
    Codec& operator=(Codec&&);

    /**
     * @brief Destructor.
     */
    ~Codec();

    /**
     * @brief Name of the underlying codec.
     */
    std::string name() const;

    /**
     * @see CodecInterface::encode
     */
    std::vector<char> encode(const nlohmann::json& document) const;

    /**
     * @see CodecInterface::decode
     */
    nlohmann::json decode(std::string_view bytes) const;

    /**
     * @brief Convenience overload for message payloads.
     */
    nlohmann::json decode(const std::vector<char>& bytes) const {
        return decode(std::string_view{bytes.data(), bytes.size()});
    }

    /**
     * @brief Factory function to create a Codec instance.
     * The built-in codecs are "msgpack", "json", and "cbor".
     * A name of the form "name:/path/to/lib.so" loads the library
     * providing the codec if it is not already registered.
     *
     * @param type Type of Codec.
     *
     * @return Codec instance.
     */
    static Codec FromName(const std::string& type);

    /**
     * @brief Checks for the validity of the underlying pointer.
     */
    operator bool() const;

    private:

    std::shared_ptr<CodecInterface> self;
};

using CodecFactory = Factory<CodecInterface>;

}

#define BLUESKY_KAFKA_REGISTER_CODEC(__name__, __type__) \
    BLUESKY_KAFKA_REGISTER_IMPLEMENTATION_FOR(CodecFactory, __type__, __name__)

#endif
