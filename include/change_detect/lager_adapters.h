// lager_adapters.h - Run digest passes from lager readers and stores
//
// A lager reader/cursor/store owning a Value publishes every new state to
// its watchers. digest_on_change() subscribes a ChangeDetector to it so that
// each published state triggers one collect_changes() pass.
//
// The reader's current value lives at a stable address for the reader's
// lifetime, so it can itself be the slot records watch:
//
//   auto state = lager::make_state(Value::map({{"count", 0}}), lager::automatic_tag{});
//   ChangeDetector detector;
//   detector.watch(state.get(), "count");
//
//   digest_on_change(state, detector, [](const ChangeRecord* head) {
//       print_changes(head);
//   });
//   state.set(state.get().set("count", 1));   // prints "count: 0 -> 1"

#pragma once

#include <change_detect/api.h>
#include <change_detect/change_detector.h>
#include <change_detect/value.h>

#include <lager/reader.hpp>
#include <lager/state.hpp>
#include <lager/watch.hpp>

#include <type_traits>
#include <utility>

namespace change_detect {

/// @brief Run a digest pass whenever `watchable` publishes a new state
/// @param watchable A lager reader, cursor, state or store holding a Value
/// @param detector Detector to digest; must outlive the watcher
/// @param callback Called with the head of the change list when a pass reports changes
/// @param on_error Exception handler forwarded to collect_changes()
/// @return The result of lager::watch (the watcher stays attached to `watchable`)
template <typename Watchable, typename Callback>
    requires std::is_same_v<typename Watchable::value_type, Value>
auto digest_on_change(Watchable& watchable, ChangeDetector& detector, Callback&& callback,
                      ExceptionHandler on_error = {}) {
    return lager::watch(watchable,
                        [&detector, callback = std::forward<Callback>(callback),
                         on_error = std::move(on_error)](const Value&) mutable {
                            if (const ChangeRecord* head = detector.collect_changes(on_error)) {
                                callback(head);
                            }
                        });
}

} // namespace change_detect
