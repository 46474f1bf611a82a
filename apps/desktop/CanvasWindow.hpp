#ifndef CANVASWINDOW_HPP
#define CANVASWINDOW_HPP
#include "core/config/RecognitionConfig.hpp"
#include "core/input/InputManager.hpp"
#include "core/recognition/RecognitionController.hpp"
#include "core/storage/LibraryStore.hpp"
#include "utils/Logger.hpp"
#include <QColor>
#include <QCoreApplication>
#include <QInputDialog>
#include <QKeySequence>
#include <QLabel>
#include <QLineEdit>
#include <QListWidget>
#include <QMouseEvent>
#include <QPainter>
#include <QPainterPath>
#include <QPointF>
#include <QPen>
#include <QResizeEvent>
#include <QShortcut>
#include <QString>
#include <QStringList>
#include <QVBoxLayout>
#include <QWidget>
#include <algorithm>
#include <deque>
#include <string>
#include <vector>

struct CanvasWindowOptions {
  int strokeWidth{3};
  QColor strokeColor{20, 20, 20};
  QColor background{250, 250, 245};
  bool fullscreen{false};
  int historySize{10};
};

// Drawing surface for the recognizer. Keys:
//   C clear  F recognize  S save symbol  Q select library  O clear library
//   L show or hide the symbol list
class CanvasWindow : public QWidget {
  Q_OBJECT
public:
  explicit CanvasWindow(const sm::RecognitionConfig &config,
                        const CanvasWindowOptions &opts = CanvasWindowOptions(),
                        QWidget *parent = nullptr)
      : QWidget(parent), m_config(config), m_options(opts),
        m_input(config.drawDistance, config.overlapDistance),
        m_controller(config) {
    setWindowTitle(tr("StrokeMatch"));
    setMouseTracking(false);
    resize(1200, 800);

    auto bind = [this](const QKeySequence &seq, void (CanvasWindow::*slot)()) {
      auto *shortcut = new QShortcut(seq, this);
      connect(shortcut, &QShortcut::activated, this, slot);
    };
    bind(QKeySequence(Qt::Key_C), &CanvasWindow::onClearDrawing);
    bind(QKeySequence(Qt::Key_F), &CanvasWindow::onRecognize);
    bind(QKeySequence(Qt::Key_S), &CanvasWindow::onSaveSymbol);
    bind(QKeySequence(Qt::Key_Q), &CanvasWindow::onSelectLibrary);
    bind(QKeySequence(Qt::Key_O), &CanvasWindow::onClearLibrary);
    bind(QKeySequence(Qt::Key_L), &CanvasWindow::onToggleSymbolList);
    auto *quit = new QShortcut(QKeySequence(Qt::Key_Escape), this);
    connect(quit, &QShortcut::activated, qApp, &QCoreApplication::quit);

    auto *layout = new QVBoxLayout(this);
    m_resultLabel = new QLabel(this);
    m_libraryLabel = new QLabel(this);
    m_historyLabel = new QLabel(this);
    m_hintLabel = new QLabel(
        tr("C clear  F recognize  S save symbol  Q select library  O clear library  "
           "L symbols"),
        this);
    for (QLabel *label : {m_resultLabel, m_libraryLabel, m_historyLabel, m_hintLabel}) {
      label->setAttribute(Qt::WA_TransparentForMouseEvents);
      label->setStyleSheet("color:#444444;font-size:13px;");
      layout->addWidget(label);
    }
    m_resultLabel->setStyleSheet("color:#202020;font-size:20px;");
    layout->addStretch();

    // Floats over the canvas on the right; clicking a symbol redraws it.
    m_symbolList = new QListWidget(this);
    m_symbolList->setStyleSheet("background:#F0F0EA;color:#202020;font-size:13px;");
    m_symbolList->setCursor(Qt::ArrowCursor);
    connect(m_symbolList, &QListWidget::itemClicked, this,
            [this](QListWidgetItem *item) { displaySymbol(item->text().toStdString()); });

    loadLibraries();
    updateLibraryLabel();
    updateSymbolListGeometry();
    m_input.startCapture();
  }

protected:
  void mousePressEvent(QMouseEvent *event) override {
    if (event->button() != Qt::LeftButton)
      return;
    m_input.liftPen();
    m_strokes.push_back(QPainterPath(event->pos()));
    addCanvasPoint(event->pos());
    update();
  }

  void mouseMoveEvent(QMouseEvent *event) override {
    if (!(event->buttons() & Qt::LeftButton) || m_strokes.empty())
      return;
    addCanvasPoint(event->pos());
    update();
  }

  void mouseReleaseEvent(QMouseEvent *event) override {
    if (event->button() == Qt::LeftButton)
      m_input.liftPen();
  }

  void resizeEvent(QResizeEvent *event) override {
    QWidget::resizeEvent(event);
    updateSymbolListGeometry();
  }

  void paintEvent(QPaintEvent *) override {
    QPainter p(this);
    p.setRenderHint(QPainter::Antialiasing);
    p.fillRect(rect(), m_options.background);
    QPen pen(m_options.strokeColor, m_options.strokeWidth);
    pen.setCapStyle(Qt::RoundCap);
    pen.setJoinStyle(Qt::RoundJoin);
    p.setPen(pen);
    for (const auto &path : m_strokes) {
      if (path.elementCount() == 1)
        p.drawPoint(path.currentPosition());
      else
        p.drawPath(path);
    }
  }

private slots:
  void onClearDrawing() {
    m_strokes.clear();
    m_input.startCapture();
    update();
  }

  void onRecognize() {
    auto match = m_controller.match(m_input.points());
    if (!match) {
      m_resultLabel->setText(tr("Library is empty"));
      return;
    }
    const QString name = QString::fromStdString(match->name);
    m_resultLabel->setText(QString("%1  (%2%)").arg(name).arg(match->percent, 0, 'f', 2));
    m_history.push_front(name);
    while (static_cast<int>(m_history.size()) > m_options.historySize)
      m_history.pop_back();
    QStringList names;
    for (const auto &h : m_history)
      names << h;
    m_historyLabel->setText(tr("History: %1").arg(names.join(QStringLiteral("  "))));
    SM_LOG(sm::LogLevel::Info, "Detected symbol: " + match->name + " (" +
                                   std::to_string(match->percent) + "%)");
  }

  // Naming is a blocking request; the recognizer never waits on UI.
  void onSaveSymbol() {
    if (m_input.points().empty())
      return;
    bool ok = false;
    QString name = QInputDialog::getText(this, tr("Save Symbol"), tr("Symbol name:"),
                                         QLineEdit::Normal, QString(), &ok);
    name = name.trimmed();
    if (!ok || name.isEmpty())
      return;
    m_controller.addDrawing(name.toStdString(), m_input.points());
    saveLibraries();
    updateLibraryLabel();
    onClearDrawing();
  }

  void onSelectLibrary() {
    bool ok = false;
    const int last = static_cast<int>(m_controller.libraries().size()) - 1;
    int index = QInputDialog::getInt(this, tr("Select Library"), tr("Library index:"),
                                     static_cast<int>(m_controller.currentIndex()), 0,
                                     last, 1, &ok);
    if (!ok)
      return;
    if (m_controller.setLibrary(static_cast<size_t>(index)))
      updateLibraryLabel();
  }

  void onClearLibrary() {
    m_controller.currentLibrary().clear();
    SM_LOG(sm::LogLevel::Info, "Cleared library " + m_controller.currentLibrary().name());
    saveLibraries();
    updateLibraryLabel();
  }

  void onToggleSymbolList() {
    if (m_symbolList->isVisible()) {
      m_symbolList->hide();
    } else {
      updateSymbolListGeometry();
      m_symbolList->show();
      m_symbolList->raise();
    }
  }

private:
  // Canvas y grows downward; strokes are stored with y up.
  void addCanvasPoint(const QPoint &pos) {
    if (m_input.addPoint(static_cast<float>(pos.x()), static_cast<float>(height() - pos.y())))
      m_strokes.back().lineTo(pos);
  }

  void loadLibraries() {
    auto loaded = sm::LibraryStore::load(m_config.libraryFile);
    if (loaded && !loaded->empty()) {
      m_controller.replaceLibraries(std::move(*loaded));
      return;
    }
    saveLibraries();
  }

  void saveLibraries() {
    if (!sm::LibraryStore::save(m_config.libraryFile, m_controller.libraries()))
      m_resultLabel->setText(tr("Could not save libraries"));
  }

  void updateLibraryLabel() {
    const auto &lib = m_controller.currentLibrary();
    m_libraryLabel->setText(tr("Library %1 (%2), %3 symbols")
                                .arg(m_controller.currentIndex())
                                .arg(QString::fromStdString(lib.name()))
                                .arg(lib.size()));
    updateSymbolList();
  }

  // The reserved blank entry is not listed.
  void updateSymbolList() {
    m_symbolList->clear();
    for (const sm::Character &c : m_controller.currentLibrary().characters()) {
      if (c.name() == sm::CharacterLibrary::kEmptyName && c.bitmap().pointCount() == 0)
        continue;
      m_symbolList->addItem(QString::fromStdString(c.name()));
    }
  }

  void updateSymbolListGeometry() {
    const int panelWidth = 180;
    const int x = std::max(10, width() - panelWidth - 20);
    m_symbolList->setGeometry(x, 40, panelWidth, std::max(120, height() - 80));
    m_symbolList->raise();
  }

  // Replaces the drawing with a stored symbol so it can be inspected or
  // recognized again.
  void displaySymbol(const std::string &name) {
    const sm::Character *c = m_controller.currentLibrary().find(name);
    if (!c)
      return;
    const std::vector<sm::Point> &points = c->bitmap().points();
    m_strokes.clear();
    m_input.startCapture();
    m_input.replacePoints(points);
    if (!points.empty()) {
      auto toCanvas = [this](const sm::Point &p) {
        return QPointF(p.x, height() - p.y);
      };
      QPainterPath path(toCanvas(points.front()));
      for (size_t i = 1; i < points.size(); ++i)
        path.lineTo(toCanvas(points[i]));
      m_strokes.push_back(path);
    }
    m_resultLabel->setText(QString::fromStdString(name));
    update();
  }

  sm::RecognitionConfig m_config;
  CanvasWindowOptions m_options;
  sm::InputManager m_input;
  sm::RecognitionController m_controller;
  std::vector<QPainterPath> m_strokes;
  std::deque<QString> m_history;
  QLabel *m_resultLabel{nullptr};
  QLabel *m_libraryLabel{nullptr};
  QLabel *m_historyLabel{nullptr};
  QLabel *m_hintLabel{nullptr};
  QListWidget *m_symbolList{nullptr};
};

#endif // CANVASWINDOW_HPP
