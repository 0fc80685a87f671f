#include "IOBroker.hpp"

namespace hb {
IOBroker::IOBroker(shared_ptr<EventLoop> _loop, const BrokerConfig& _config)
    : loop(_loop), config(_config) {}

IOBroker::~IOBroker() {
  for (auto& it : sources) {
    if (it.second.flushTimer) {
      loop->cancel(it.second.flushTimer);
    }
  }
  for (auto& it : inputs) {
    if (it.second.pauseTimer) {
      loop->cancel(it.second.pauseTimer);
    }
  }
}

void IOBroker::openSource(const string& sourceId) {
  if (sources.find(sourceId) != sources.end()) {
    VLOG(1) << "Reopening source " << sourceId;
    return;
  }
  sources[sourceId] = Source();
  VLOG(1) << "Opened source " << sourceId;
}

void IOBroker::removeSource(const string& sourceId) {
  auto it = sources.find(sourceId);
  if (it == sources.end()) {
    return;
  }
  if (it->second.flushTimer) {
    loop->cancel(it->second.flushTimer);
  }
  VLOG(1) << "Removed source " << sourceId << " at sequence "
          << it->second.lastSequence;
  sources.erase(it);
}

void IOBroker::publish(const string& sourceId, const string& bytes) {
  if (bytes.empty()) {
    return;
  }
  auto it = sources.find(sourceId);
  if (it == sources.end()) {
    openSource(sourceId);
    it = sources.find(sourceId);
  }
  Source& source = it->second;
  source.pending.append(bytes);
  if (source.pending.size() >= config.maxBatchBytes) {
    flush(sourceId);
    return;
  }
  if (!source.flushTimer) {
    source.flushTimer = loop->schedule(config.coalesceWindow, [this, sourceId]() {
      auto it = sources.find(sourceId);
      if (it == sources.end()) {
        return;
      }
      it->second.flushTimer = 0;
      flush(sourceId);
    });
  }
}

void IOBroker::flush(const string& sourceId) {
  auto it = sources.find(sourceId);
  if (it == sources.end()) {
    return;
  }
  Source& source = it->second;
  if (source.flushTimer) {
    loop->cancel(source.flushTimer);
    source.flushTimer = 0;
  }
  if (source.pending.empty()) {
    return;
  }
  string pending;
  pending.swap(source.pending);

  vector<OutputEvent> fresh;
  size_t pos = 0;
  while (pos < pending.size()) {
    size_t count = min(config.maxBatchBytes, pending.size() - pos);
    OutputEvent event;
    event.set_sourceid(sourceId);
    event.set_payload(pending.substr(pos, count));
    event.set_sequence(++source.lastSequence);
    event.set_timestampms(nowMs());
    source.events.push_back(event);
    source.bytes += count;
    fresh.push_back(event);
    pos += count;
  }
  VLOG(3) << "Cut " << fresh.size() << " event(s) for " << sourceId
          << " ending at sequence " << source.lastSequence;
  enforceCap(&source);

  vector<Tap> taps = source.taps;
  for (const auto& event : fresh) {
    for (auto& tap : taps) {
      tap(event);
    }
  }

  // A tap may have removed the source.
  it = sources.find(sourceId);
  if (it == sources.end()) {
    return;
  }
  deliver(&it->second);
}

void IOBroker::addTap(const string& sourceId, Tap tap) {
  auto it = sources.find(sourceId);
  if (it == sources.end()) {
    openSource(sourceId);
    it = sources.find(sourceId);
  }
  it->second.taps.push_back(tap);
}

void IOBroker::clearTaps(const string& sourceId) {
  auto it = sources.find(sourceId);
  if (it != sources.end()) {
    it->second.taps.clear();
  }
}

bool IOBroker::attach(const string& sourceId, shared_ptr<OutputSink> sink) {
  auto it = sources.find(sourceId);
  if (it == sources.end()) {
    return false;
  }
  Source& source = it->second;
  bool alreadyAttached = false;
  for (auto& attachment : source.attachments) {
    if (attachment.sink == sink) {
      alreadyAttached = true;
    }
  }
  if (!alreadyAttached) {
    Attachment attachment;
    attachment.sink = sink;
    attachment.cursor = source.events.empty() ? source.lastSequence + 1
                                              : source.events.front().sequence();
    source.attachments.push_back(attachment);
    LOG(INFO) << "Attached consumer to " << sourceId << ", replaying "
              << source.events.size() << " buffered event(s)";
  }
  for (auto& attachment : source.attachments) {
    if (attachment.sink == sink) {
      deliverTo(&source, &attachment);
      break;
    }
  }
  trimDelivered(&source);
  return true;
}

void IOBroker::detach(const string& sourceId, const OutputSink* sink) {
  auto it = sources.find(sourceId);
  if (it == sources.end()) {
    return;
  }
  auto& attachments = it->second.attachments;
  for (auto a = attachments.begin(); a != attachments.end(); ++a) {
    if (a->sink.get() == sink) {
      attachments.erase(a);
      LOG(INFO) << "Detached consumer from " << sourceId;
      break;
    }
  }
  trimDelivered(&it->second);
}

void IOBroker::detachAll(const OutputSink* sink) {
  vector<string> attachedTo;
  for (auto& it : sources) {
    for (auto& attachment : it.second.attachments) {
      if (attachment.sink.get() == sink) {
        attachedTo.push_back(it.first);
      }
    }
  }
  for (const auto& sourceId : attachedTo) {
    detach(sourceId, sink);
  }
}

void IOBroker::resume(const OutputSink* sink) {
  for (auto& it : sources) {
    Source& source = it.second;
    for (auto& attachment : source.attachments) {
      if (attachment.sink.get() == sink) {
        deliverTo(&source, &attachment);
        break;
      }
    }
    trimDelivered(&source);
  }
}

int64_t IOBroker::lastSequence(const string& sourceId) const {
  auto it = sources.find(sourceId);
  if (it == sources.end()) {
    return 0;
  }
  return it->second.lastSequence;
}

size_t IOBroker::bufferedBytes(const string& sourceId) const {
  auto it = sources.find(sourceId);
  if (it == sources.end()) {
    return 0;
  }
  return it->second.bytes;
}

vector<OutputEvent> IOBroker::bufferedEvents(const string& sourceId) const {
  vector<OutputEvent> events;
  auto it = sources.find(sourceId);
  if (it != sources.end()) {
    events.insert(events.end(), it->second.events.begin(),
                  it->second.events.end());
  }
  return events;
}

void IOBroker::enforceCap(Source* source) {
  while (source->bytes > config.maxBufferedBytes) {
    if (!dropOldest(source)) {
      break;
    }
  }
}

bool IOBroker::dropOldest(Source* source) {
  auto& events = source->events;
  auto it = find_if(events.begin(), events.end(),
                    [](const OutputEvent& e) { return !e.gap(); });
  if (it == events.end()) {
    return false;
  }
  int64_t sequence = it->sequence();
  source->bytes -= it->payload().size();
  LOG(WARNING) << "Buffer full for " << it->sourceid()
               << ", discarding event " << sequence;

  if (it != events.begin()) {
    auto previous = it - 1;
    // Widen the marker nobody has seen yet instead of stacking a new one.
    if (previous->gap() && !seenByAnyone(*source, previous->sequence())) {
      previous->set_sequence(sequence);
      events.erase(it);
      return true;
    }
  }
  OutputEvent marker;
  marker.set_sourceid(it->sourceid());
  marker.set_sequence(sequence);
  marker.set_timestampms(nowMs());
  marker.set_gap(true);
  marker.set_firstdroppedsequence(sequence);
  *it = marker;
  return true;
}

bool IOBroker::seenByAnyone(const Source& source, int64_t sequence) const {
  for (const auto& attachment : source.attachments) {
    if (attachment.cursor > sequence) {
      return true;
    }
  }
  return false;
}

void IOBroker::deliver(Source* source) {
  vector<const OutputSink*> sinks;
  for (auto& attachment : source->attachments) {
    sinks.push_back(attachment.sink.get());
  }
  for (auto sink : sinks) {
    for (auto& attachment : source->attachments) {
      if (attachment.sink.get() == sink) {
        deliverTo(source, &attachment);
        break;
      }
    }
  }
  trimDelivered(source);
}

void IOBroker::deliverTo(Source* source, Attachment* attachment) {
  auto& events = source->events;
  auto it = lower_bound(events.begin(), events.end(), attachment->cursor,
                        [](const OutputEvent& e, int64_t sequence) {
                          return e.sequence() < sequence;
                        });
  for (; it != events.end(); ++it) {
    if (!attachment->sink->deliver(*it)) {
      VLOG(2) << "Consumer congested on " << it->sourceid() << " at sequence "
              << it->sequence();
      return;
    }
    attachment->cursor = it->sequence() + 1;
  }
}

void IOBroker::trimDelivered(Source* source) {
  if (source->attachments.empty()) {
    return;
  }
  int64_t minCursor = source->attachments.front().cursor;
  for (const auto& attachment : source->attachments) {
    minCursor = min(minCursor, attachment.cursor);
  }
  auto& events = source->events;
  while (!events.empty() && events.front().sequence() < minCursor) {
    source->bytes -= events.front().payload().size();
    events.pop_front();
  }
}

void IOBroker::openInput(const string& sourceId, InputHandler handler) {
  closeInput(sourceId);
  Input input;
  input.handler = handler;
  inputs[sourceId] = input;
}

void IOBroker::closeInput(const string& sourceId) {
  auto it = inputs.find(sourceId);
  if (it == inputs.end()) {
    return;
  }
  flushInput(sourceId, &it->second);
  it = inputs.find(sourceId);
  if (it != inputs.end()) {
    inputs.erase(it);
  }
}

bool IOBroker::write(const string& sourceId, const string& data) {
  auto it = inputs.find(sourceId);
  if (it == inputs.end()) {
    return false;
  }
  Input& input = it->second;
  input.pending.append(data);

  size_t newline;
  while ((newline = input.pending.find('\n')) != string::npos) {
    string command = input.pending.substr(0, newline + 1);
    input.pending.erase(0, newline + 1);
    InputHandler handler = input.handler;
    handler(command, true);
  }

  if (input.pauseTimer) {
    loop->cancel(input.pauseTimer);
    input.pauseTimer = 0;
  }
  if (input.pending.size() >= config.maxBatchBytes) {
    flushInput(sourceId, &input);
  } else if (!input.pending.empty()) {
    input.pauseTimer = loop->schedule(config.inputPause, [this, sourceId]() {
      auto it = inputs.find(sourceId);
      if (it == inputs.end()) {
        return;
      }
      it->second.pauseTimer = 0;
      flushInput(sourceId, &it->second);
    });
  }
  return true;
}

void IOBroker::flushInput(const string& sourceId, Input* input) {
  if (input->pauseTimer) {
    loop->cancel(input->pauseTimer);
    input->pauseTimer = 0;
  }
  if (input->pending.empty()) {
    return;
  }
  string data;
  data.swap(input->pending);
  VLOG(3) << "Flushing " << data.size() << " input byte(s) for " << sourceId;
  InputHandler handler = input->handler;
  handler(data, data.back() == '\n');
}
}  // namespace hb
