#ifndef LCDWIDGET_H
#define LCDWIDGET_H

#include <QWidget>
#include <QFont>
#include <QColor>
#include <QString>
#include <QStringList>

// Read-only LCD look-alike: white monospace text on the HHT blue.
class LcdWidget : public QWidget
{
    Q_OBJECT

public:
    explicit LcdWidget(QWidget *parent = nullptr);

public slots:
    void setText(const QString &text);
    void setHighlighted(bool on);

protected:
    void paintEvent(QPaintEvent *event) override;

private:
    void updateMetrics();

    QStringList m_rows;
    QFont m_font;
    int m_charHeight;
    int m_margin = 8;

    bool m_highlighted = false;
    QColor m_background = QColor(0x00, 0x1A, 0x99);
};

#endif // LCDWIDGET_H
