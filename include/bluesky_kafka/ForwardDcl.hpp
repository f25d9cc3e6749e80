/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef BLUESKY_KAFKA_FORWARD_DECL_HPP
#define BLUESKY_KAFKA_FORWARD_DECL_HPP

namespace bluesky_kafka {

class AlreadyStoppedError;
class BasicConsumer;
class BasicProducer;
struct BrokerError;
struct BrokerMetadata;
struct ClusterMetadata;
class CodecInterface;
class Codec;
class Config;
class ConsumerClientInterface;
class DecodeError;
class DocumentConsumer;
enum class DocumentName;
class Exception;
struct Message;
struct MessageMetadata;
struct PartitionMetadata;
class ProducerClientInterface;
class Publisher;
class RemoteDispatcher;
struct TopicMetadata;

}

#endif
