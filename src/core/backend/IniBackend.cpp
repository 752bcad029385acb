#include "IniBackend.hpp"
#include "core/AtomicFile.hpp"
#include "core/Errors.hpp"
#include <QTextStream>
#include <boost/log/trivial.hpp>

namespace sigil {

namespace {

QString escapeValue(const QString& value)
{
    QString out;
    out.reserve(value.size());
    for (QChar c : value) {
        if (c == QLatin1Char('\\'))
            out += QStringLiteral("\\\\");
        else if (c == QLatin1Char('\n'))
            out += QStringLiteral("\\n");
        else if (c == QLatin1Char('\r'))
            out += QStringLiteral("\\r");
        else if (c == QLatin1Char('"'))
            out += QStringLiteral("\\\"");
        else
            out += c;
    }
    return out;
}

// Values the parser would otherwise trim or misread are written in quotes.
bool needsQuotes(const QString& value)
{
    return !value.isEmpty()
        && (value.front().isSpace() || value.back().isSpace() || value.front() == QLatin1Char('"'));
}

QString unescapeValue(const QString& value)
{
    QString out;
    out.reserve(value.size());
    for (int i = 0; i < value.size(); ++i) {
        QChar c = value.at(i);
        if (c == QLatin1Char('\\') && i + 1 < value.size()) {
            QChar next = value.at(i + 1);
            if (next == QLatin1Char('\\')) { out += QLatin1Char('\\'); ++i; continue; }
            if (next == QLatin1Char('n')) { out += QLatin1Char('\n'); ++i; continue; }
            if (next == QLatin1Char('r')) { out += QLatin1Char('\r'); ++i; continue; }
            if (next == QLatin1Char('"')) { out += QLatin1Char('"'); ++i; continue; }
        }
        out += c;
    }
    return out;
}

QString parseValue(const QString& text)
{
    if (text.size() >= 2 && text.startsWith(QLatin1Char('"')) && text.endsWith(QLatin1Char('"')))
        return unescapeValue(text.mid(1, text.size() - 2));
    return unescapeValue(text);
}

} // namespace

Mapping IniBackend::parse(const QByteArray& text, const QString& sourceName)
{
    Mapping data;
    QString section;
    bool haveSection = false;
    int lineNo = 0;

    QTextStream in(text);
    while (!in.atEnd()) {
        ++lineNo;
        const QString line = in.readLine().trimmed();
        if (line.isEmpty() || line.startsWith(QLatin1Char('#')) || line.startsWith(QLatin1Char(';')))
            continue;

        if (line.startsWith(QLatin1Char('['))) {
            if (!line.endsWith(QLatin1Char(']')))
                throw CorruptFileError(sourceName, QStringLiteral("line %1: unterminated section header").arg(lineNo));
            section = line.mid(1, line.size() - 2).trimmed();
            if (section.isEmpty())
                throw CorruptFileError(sourceName, QStringLiteral("line %1: empty section name").arg(lineNo));
            haveSection = true;
            continue;
        }

        const int eq = line.indexOf(QLatin1Char('='));
        if (eq < 0)
            throw CorruptFileError(sourceName, QStringLiteral("line %1: expected key = value").arg(lineNo));
        if (!haveSection)
            throw CorruptFileError(sourceName, QStringLiteral("line %1: key outside of any section").arg(lineNo));

        const QString key = line.left(eq).trimmed();
        if (key.isEmpty())
            throw CorruptFileError(sourceName, QStringLiteral("line %1: empty key").arg(lineNo));

        const QString dotted = joinSectionKey(section, key);
        if (data.contains(dotted))
            throw CorruptFileError(sourceName, QStringLiteral("line %1: duplicate key '%2'").arg(lineNo).arg(dotted));
        data.insert(dotted, parseValue(line.mid(eq + 1).trimmed()));
    }
    return data;
}

QByteArray IniBackend::serialize(const Mapping& data)
{
    // section -> (leaf -> value), both sorted
    QMap<QString, QMap<QString, QString>> sections;
    for (auto it = data.constBegin(); it != data.constEnd(); ++it) {
        if (!isValidKey(it.key()))
            throw InvalidKeyError(it.key());
        const QStringList parts = splitSectionKey(it.key());
        sections[parts[0]][parts[1]] = it.value();
    }

    QByteArray out;
    QTextStream stream(&out);
    bool first = true;
    for (auto s = sections.constBegin(); s != sections.constEnd(); ++s) {
        if (!first)
            stream << "\n";
        first = false;
        stream << "[" << s.key() << "]\n";
        for (auto kv = s.value().constBegin(); kv != s.value().constEnd(); ++kv) {
            stream << kv.key() << " = ";
            if (needsQuotes(kv.value()))
                stream << '"' << escapeValue(kv.value()) << '"';
            else
                stream << escapeValue(kv.value());
            stream << "\n";
        }
    }
    stream.flush();
    return out;
}

Mapping IniBackend::load(const QString& path) const
{
    const QByteArray text = readWholeFile(path);
    try {
        return parse(text, path);
    } catch (const CorruptFileError& e) {
        BOOST_LOG_TRIVIAL(error) << "IniBackend: " << e.what();
        throw;
    }
}

void IniBackend::save(const QString& path, const Mapping& data) const
{
    writeFileAtomically(path, serialize(data));
}

} // namespace sigil
