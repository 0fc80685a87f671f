#ifndef __HB_IO_BROKER__
#define __HB_IO_BROKER__

#include "EventLoop.hpp"
#include "Headers.hpp"
#include "SupervisorConfig.hpp"

namespace hb {
/**
 * @brief A consumer of one or more output streams.
 */
class OutputSink {
 public:
  virtual ~OutputSink() {}

  /**
   * @brief Hands one event to the consumer.
   * @return false when the consumer is congested; the event stays buffered
   * and is offered again after `IOBroker::resume`.
   */
  virtual bool deliver(const OutputEvent& event) = 0;
};

/**
 * @brief Multiplexes process output into ordered per-source event streams
 * and coalesces inbound writes into logical commands.
 *
 * Output bytes published within the coalescing window become one event.
 * Sequence numbers are assigned when an event is cut, so they are strictly
 * increasing per source. Events stay buffered until every attached consumer
 * has taken them, or indefinitely while nobody is attached; past the buffer
 * cap the oldest events are replaced by a gap marker.
 *
 * Loop-thread only.
 */
class IOBroker {
 public:
  /** @brief Internal subscriber that sees every event exactly once. */
  typedef function<void(const OutputEvent&)> Tap;
  /**
   * @brief Receives coalesced input.
   * @param complete True when the chunk ends with a newline.
   */
  typedef function<void(const string& data, bool complete)> InputHandler;

  IOBroker(shared_ptr<EventLoop> _loop, const BrokerConfig& _config);
  ~IOBroker();

  /** @brief Creates the source, or reopens it keeping its sequence. */
  void openSource(const string& sourceId);
  /** @brief Drops the source with its buffer, taps and attachments. */
  void removeSource(const string& sourceId);
  bool hasSource(const string& sourceId) const {
    return sources.find(sourceId) != sources.end();
  }

  /** @brief Appends raw output bytes to the source's pending batch. */
  void publish(const string& sourceId, const string& bytes);
  /** @brief Cuts the pending batch into events right away. */
  void flush(const string& sourceId);

  void addTap(const string& sourceId, Tap tap);
  void clearTaps(const string& sourceId);

  /**
   * @brief Starts pushing the source to `sink`: buffered events first, then
   * live ones.
   * @return false if the source is unknown.
   */
  bool attach(const string& sourceId, shared_ptr<OutputSink> sink);
  void detach(const string& sourceId, const OutputSink* sink);
  /** @brief Detaches the sink from every source. */
  void detachAll(const OutputSink* sink);
  /** @brief The sink drained; offer it everything it still lacks. */
  void resume(const OutputSink* sink);

  int64_t lastSequence(const string& sourceId) const;
  size_t bufferedBytes(const string& sourceId) const;
  /** @brief Events currently buffered for the source, oldest first. */
  vector<OutputEvent> bufferedEvents(const string& sourceId) const;

  /** @brief Routes writes for `sourceId` through the input coalescer. */
  void openInput(const string& sourceId, InputHandler handler);
  /** @brief Flushes pending input and stops accepting writes. */
  void closeInput(const string& sourceId);
  /** @return false if no input is open for the source. */
  bool write(const string& sourceId, const string& data);

 protected:
  struct Attachment {
    shared_ptr<OutputSink> sink;
    // Next sequence this sink has not seen yet.
    int64_t cursor;
  };

  struct Source {
    string pending;
    EventLoop::TimerId flushTimer = 0;
    int64_t lastSequence = 0;
    deque<OutputEvent> events;
    size_t bytes = 0;
    vector<Attachment> attachments;
    vector<Tap> taps;
  };

  struct Input {
    string pending;
    EventLoop::TimerId pauseTimer = 0;
    InputHandler handler;
  };

  shared_ptr<EventLoop> loop;
  BrokerConfig config;
  map<string, Source> sources;
  map<string, Input> inputs;

  void cutEvent(const string& sourceId, Source* source, const string& payload);
  void enforceCap(Source* source);
  bool dropOldest(Source* source);
  bool seenByAnyone(const Source& source, int64_t sequence) const;
  void deliver(Source* source);
  void deliverTo(Source* source, Attachment* attachment);
  void trimDelivered(Source* source);
  void flushInput(const string& sourceId, Input* input);
};
}  // namespace hb

#endif  // __HB_IO_BROKER__
