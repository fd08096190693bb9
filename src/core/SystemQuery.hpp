#pragma once
#include <QString>
#include <QStringList>

namespace usb_audio {

// Runs local device-management and sound tools. An empty result means the
// signal is unavailable; callers never treat it as an error.
class SystemQuery {
public:
    virtual ~SystemQuery() = default;

    virtual QString run(const QString& program, const QStringList& arguments) const = 0;
    virtual bool execute(const QString& program, const QStringList& arguments) const = 0;
};

class ProcessSystemQuery : public SystemQuery {
public:
    QString run(const QString& program, const QStringList& arguments) const override;
    bool execute(const QString& program, const QStringList& arguments) const override;
};

}
