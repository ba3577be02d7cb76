#include <QApplication>
#include <QLabel>
#include <QPushButton>
#include <QVBoxLayout>
#include <QWidget>

#include <quantum/quantum.hpp>
#include <quantum/adapters/qt.hpp>

using namespace quantum;

struct Clicks {
  int count{0};
  bool operator==(const Clicks& o) const { return count == o.count; }
};

int main(int argc, char** argv) {
  QApplication app(argc, argv);

  // ----- UI -----
  QWidget window;
  window.setWindowTitle("quantum × Qt | Counter");

  auto* label  = new QLabel("clicks: 0");
  auto* button = new QPushButton("click");
  auto* reset  = new QPushButton("reset");

  auto* layout = new QVBoxLayout;
  layout->addWidget(label);
  layout->addWidget(button);
  layout->addWidget(reset);
  window.setLayout(layout);
  window.resize(240, 120);
  window.show();

  // ----- State: cycles and deliveries on the GUI thread -----
  store<Clicks> clicks(Clicks{}, qt::cooperative(&window));

  auto sub = clicks.add_listener([=](const Clicks& c){
    label->setText(QString("clicks: %1").arg(c.count));
  });

  QObject::connect(button, &QPushButton::clicked, [&]{
    clicks.set_state([](const Clicks& c){ return Clicks{c.count + 1}; });
  });
  QObject::connect(reset, &QPushButton::clicked, [&]{
    clicks.set_state([](const Clicks&){ return Clicks{}; });
  });

  const int rc = app.exec();
  clicks.quit();
  return rc;
}
