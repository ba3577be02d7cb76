#pragma once

#include <QObject>
#include <QCoreApplication>
#include <QTimer>
#include <QMetaObject>

#include <functional>
#include <memory>
#include <utility>

#include <quantum/core/scheduler.hpp>
#include <quantum/core/config.hpp>

namespace quantum {
namespace qt {

// ====================================================================================
// qt_executor - “bridge” to the Qt thread of `target` via QMetaObject::invokeMethod
// The Qt event loop runs posted tasks one at a time, which is exactly what a
// cooperative store needs.
// ====================================================================================
class qt_executor : public executor {
public:
  explicit qt_executor(QObject* target = QCoreApplication::instance())
  : target_(target ? target : QCoreApplication::instance()) {}

  void post(std::function<void()> f) override {
    QObject* tgt = target_;
    if (!tgt) { f(); return; }

#if QT_VERSION >= QT_VERSION_CHECK(5, 10, 0)
    QMetaObject::invokeMethod(
      tgt,
      [fn = std::move(f)]() mutable { fn(); },
      Qt::QueuedConnection
    );
#else
    QTimer::singleShot(0, tgt, [fn = std::move(f)]() mutable { fn(); });
#endif
  }

  QObject* target() const { return target_; }

private:
  QObject* target_ = nullptr;
};

// ====================================================================================
// cooperative(QObject*): a store whose cycles and listener deliveries both
// run on the thread of `target` (the GUI thread by default)
// ====================================================================================
inline threading cooperative(QObject* target = QCoreApplication::instance()) {
  auto exec = std::make_shared<qt_executor>(target);
  auto t = threading::cooperative(exec);
  t.deliver_on(exec);
  return t;
}

} // namespace qt
} // namespace quantum
