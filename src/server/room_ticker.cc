#include "server/room_ticker.h"

#include <algorithm>
#include <chrono>
#include <utility>

RoomTicker::RoomTicker(WSPPServer *in_endpoint, TickHandler in_handler)
    : endpoint(in_endpoint), handler(std::move(in_handler)) {}

void RoomTicker::Start(Room *room, long interval_ms) {
  Stop(room->code());

  Task &task = tasks[room->code()];
  task.room = room;
  task.interval_ms = std::max(1L, interval_ms);
  task.generation = next_generation++;
  NextTick(room->code(), &task, GetCurrentTime());
}

bool RoomTicker::Stop(const std::string &code) {
  const auto it = tasks.find(code);
  if (it == tasks.end()) {
    return false;
  }
  if (it->second.timer) {
    it->second.timer->cancel();
  }
  tasks.erase(it);
  return true;
}

void RoomTicker::StopAll() {
  while (!tasks.empty()) {
    const std::string code = tasks.begin()->first;
    Stop(code);
  }
}

bool RoomTicker::Retire(RoomRegistry *registry, const std::string &code) {
  Stop(code);
  return registry->Destroy(code);
}

bool RoomTicker::IsActive(const std::string &code) const {
  return tasks.count(code) > 0;
}

void RoomTicker::NextTick(const std::string &code, Task *task, long last) {
  task->last_time_point = last;
  const uint64_t generation = task->generation;
  task->timer = endpoint->set_timer(
      std::max(0L, task->interval_ms - (GetCurrentTime() - last)),
      [this, code, generation](error_code const &ec) {
        on_timer(code, generation, ec);
      });
}

void RoomTicker::on_timer(const std::string &code, uint64_t generation,
                          error_code const &ec) {
  if (ec == websocketpp::transport::error::operation_aborted) {
    return;
  }

  auto it = tasks.find(code);
  if (it == tasks.end() || it->second.generation != generation) {
    return;
  }

  const long now = GetCurrentTime();
  if (ec) {
    endpoint->get_alog().write(alevel::app,
        "Room " + code + " timer error: " + ec.message());
  } else {
    handler(it->second.room);
  }

  // The handler may have stopped this room (round over, last player gone).
  it = tasks.find(code);
  if (it == tasks.end() || it->second.generation != generation) {
    return;
  }

  const long step_time = GetCurrentTime() - now;
  if (step_time > it->second.interval_ms) {
    endpoint->get_alog().write(alevel::app,
        "Load is too high, room " + code + " tick took " +
            std::to_string(step_time) + "ms");
  }

  NextTick(code, &it->second, now);
}

long RoomTicker::GetCurrentTime() {
  using std::chrono::duration_cast;
  using std::chrono::milliseconds;
  using std::chrono::steady_clock;

  return duration_cast<milliseconds>(steady_clock::now().time_since_epoch())
      .count();
}
