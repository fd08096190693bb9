#pragma once
#include <QObject>
#include <memory>

namespace usb_audio {

// Turns POSIX signals into Qt signals on the event loop thread. The handler
// only writes the signal number to a socket pair.
class SignalBridge : public QObject {
    Q_OBJECT

public:
    explicit SignalBridge(QObject* parent = nullptr);
    ~SignalBridge();

    // Installs handlers for SIGINT, SIGTERM, SIGQUIT and SIGHUP.
    bool install();

signals:
    void terminationRequested(int signalNumber);
    void reloadRequested();

private slots:
    void handleSignal();

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
