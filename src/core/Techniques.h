#pragma once

#include <QString>
#include <QStringList>
#include <QVector>

// Bass technique taxonomy. Names match the boolean flags found in a
// manifest's ArrangementProperties block.
struct SkillGroup {
    QString     id;
    QString     name;
    int         order = 0;
    QString     level;
    QStringList techniques;
};

class Techniques {
public:
    static const QStringList& manifestTechniques();
    static bool isKnown(const QString& technique);
    static QString displayName(const QString& technique);

    // Curriculum order
    static const QVector<SkillGroup>& skillGroups();
    // Empty when the technique belongs to no group
    static QString groupFor(const QString& technique);
};
