#pragma once

#include "app_core.hpp"
#include "config.hpp"
#include "storage/history_db.hpp"

#include <QMainWindow>
#include <memory>

class QComboBox;
class QLabel;
class QProgressBar;
class QPushButton;
class QTextEdit;

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(Config config, bool verbose = false, QWidget* parent = nullptr);
    ~MainWindow() override;

protected:
    void closeEvent(QCloseEvent* event) override;

private:
    void build_ui();
    void start();

    void on_model_changed(int index);
    void on_select_file();
    void on_save_transcript();
    void on_worker_complete();
    void on_progress(const AppCore::Progress& progress);

    void update_controls();
    void render_transcript(const Transcript& t);
    void set_status(const QString& text);

    Config config_;
    bool verbose_;
    HistoryDb history_db_;
    std::unique_ptr<AppCore> core_;

    QComboBox* model_combo_ = nullptr;
    QPushButton* select_button_ = nullptr;
    QPushButton* cancel_button_ = nullptr;
    QPushButton* save_button_ = nullptr;
    QProgressBar* progress_ = nullptr;
    QTextEdit* output_ = nullptr;
    QLabel* status_ = nullptr;
};
