#include "LcdWidget.h"
#include <QPainter>
#include <QFontMetrics>
#include <utility>

LcdWidget::LcdWidget(QWidget *parent) : QWidget(parent)
{
    m_font = QFont("Consolas", 14);
    m_font.setStyleHint(QFont::Monospace);
    updateMetrics();

    QPalette p = palette();
    p.setColor(QPalette::Window, m_background);
    setPalette(p);
    setAutoFillBackground(true);

    setMinimumSize(320, 160);
}

void LcdWidget::updateMetrics()
{
    QFontMetrics fm(m_font);
    m_charHeight = fm.height();
    if (m_charHeight <= 0) m_charHeight = 20;
}

void LcdWidget::setText(const QString &text)
{
    m_rows = text.split('\n');
    update();
}

void LcdWidget::setHighlighted(bool on)
{
    if (m_highlighted == on) return;
    m_highlighted = on;
    update();
}

void LcdWidget::paintEvent(QPaintEvent *)
{
    QPainter painter(this);
    painter.setFont(m_font);

    // frame like the real unit
    painter.setPen(QPen(QColor(0x11, 0x11, 0x11), 3));
    painter.drawRect(rect().adjusted(1, 1, -2, -2));

    painter.setPen(m_highlighted ? Qt::yellow : Qt::white);

    QFontMetrics fm(m_font);
    int y = m_margin + fm.ascent();

    for (const QString &row : std::as_const(m_rows)) {
        if (y - fm.ascent() > height()) break;
        painter.drawText(m_margin, y, row);
        y += m_charHeight;
    }
}
