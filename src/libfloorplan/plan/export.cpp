// =====================================================================
//  src/libfloorplan/plan/export.cpp — Floor plan export implementation
// =====================================================================
//
//  Part of libfloorplan.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <floorplan/plan/export.h>

#include "../logging.h"

#include <QFile>
#include <QTextStream>
#include <QtMath>

#include <limits>

namespace floorplan {
namespace plan {

namespace {

/// Order in which element groups are written by both encoders
const ElementType DRAW_ORDER[] = {
    ElementType::Wall,
    ElementType::Door,
    ElementType::Window,
    ElementType::Opening,
    ElementType::Object
};

/// Formats coordinates in fixed notation with trailing zeros trimmed.
/// Non-finite values are written as 0 and remembered, so a document
/// stays parseable even if unchecked geometry reached the encoder.
class NumberWriter {
public:
    explicit NumberWriter(int decimals) : m_decimals(decimals) {}

    QString operator()(double value)
    {
        if (!qIsFinite(value)) {
            m_sawNonFinite = true;
            return QStringLiteral("0");
        }

        QString text = QString::number(value, 'f', m_decimals);
        if (text.contains(QLatin1Char('.'))) {
            while (text.endsWith(QLatin1Char('0'))) text.chop(1);
            if (text.endsWith(QLatin1Char('.'))) text.chop(1);
        }
        if (text == QLatin1String("-0")) text = QStringLiteral("0");
        return text;
    }

    bool sawNonFinite() const { return m_sawNonFinite; }

private:
    int m_decimals;
    bool m_sawNonFinite = false;
};

/// Room dimension annotation, two decimals plus unit suffix
QString dimensionText(double meters, const QString& suffix)
{
    if (!qIsFinite(meters)) meters = 0.0;
    return QString::number(meters, 'f', 2) + suffix;
}

}  // anonymous namespace

// =====================================================================
//  SVG Export
// =====================================================================

namespace {

/// Vertical distance from a dimension line to its label
constexpr double SVG_DIMENSION_LABEL_GAP = 15.0;

/// Horizontal distance from the depth line to its rotated label
constexpr double SVG_DEPTH_LABEL_GAP = 10.0;

const char* SVG_DEFS =
    "  <defs>\n"
    "    <marker id=\"arrow\" viewBox=\"0 0 10 10\" refX=\"5\" refY=\"5\" "
    "markerWidth=\"8\" markerHeight=\"8\" orient=\"auto\">\n"
    "      <path d=\"M 2 8 L 8 2\" stroke=\"#666666\" stroke-width=\"1.5\"/>\n"
    "    </marker>\n"
    "    <style type=\"text/css\">\n"
    "      .wall { fill: none; stroke: #333333; stroke-width: 8; }\n"
    "      .door { fill: none; stroke: #8B4513; stroke-width: 4; }\n"
    "      .window { fill: #87CEEB; stroke: #4169E1; stroke-width: 2; fill-opacity: 0.5; }\n"
    "      .opening { fill: none; stroke: #999999; stroke-width: 2; stroke-dasharray: 5,5; }\n"
    "      .object { fill: #E0E0E0; stroke: #666666; stroke-width: 1; }\n"
    "      .dimension-line { stroke: #666666; stroke-width: 1; }\n"
    "      .dimension { font-family: Arial, sans-serif; font-size: 12px; fill: #666666; }\n"
    "      .label { font-family: Arial, sans-serif; font-size: 10px; fill: #333333; text-anchor: middle; }\n"
    "    </style>\n"
    "  </defs>\n";

QString svgClassName(ElementType type)
{
    switch (type) {
    case ElementType::Wall:    return QStringLiteral("wall");
    case ElementType::Door:    return QStringLiteral("door");
    case ElementType::Window:  return QStringLiteral("window");
    case ElementType::Opening: return QStringLiteral("opening");
    case ElementType::Object:  return QStringLiteral("object");
    }
    return QStringLiteral("object");
}

/// Canvas size in whole user units; degenerate input collapses to zero
int canvasExtent(double extent)
{
    if (!qIsFinite(extent) || extent < 0.0) return 0;
    if (extent >= static_cast<double>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(extent);
}

/// Escaped character data; control characters XML 1.0 does not allow
/// are dropped
QString svgTextValue(const QString& text)
{
    QString value;
    value.reserve(text.size());
    for (QChar c : text) {
        if (c.unicode() < 0x20 && c != QLatin1Char('\t') && c != QLatin1Char('\n') &&
            c != QLatin1Char('\r')) {
            continue;
        }
        if (c.unicode() == 0xFFFE || c.unicode() == 0xFFFF) continue;
        value.append(c);
    }
    return value.toHtmlEscaped();
}

void writeSVGElement(QTextStream& out, const FloorPlanElement& element,
                     const QRectF& box, const SVGExportOptions& options,
                     NumberWriter& n)
{
    double x = (element.rect.left() - box.left()) * options.scale;
    double y = (element.rect.top() - box.top()) * options.scale;
    double w = element.rect.width() * options.scale;
    double h = element.rect.height() * options.scale;

    QString transform;
    if (options.applyRotation && element.rotation != 0.0 && qIsFinite(element.rotation)) {
        transform = QStringLiteral(" transform=\"rotate(%1, %2, %3)\"")
            .arg(n(qRadiansToDegrees(element.rotation)))
            .arg(n(x + w / 2.0))
            .arg(n(y + h / 2.0));
    }

    out << QStringLiteral("    <rect class=\"%1\" x=\"%2\" y=\"%3\" width=\"%4\" height=\"%5\"%6/>\n")
           .arg(svgClassName(element.kind.type()))
           .arg(n(x)).arg(n(y)).arg(n(w)).arg(n(h))
           .arg(transform);

    if (element.kind.isObject() && element.label) {
        out << QStringLiteral("    <text class=\"label\" x=\"%1\" y=\"%2\">%3</text>\n")
               .arg(n(x + w / 2.0))
               .arg(n(y + h / 2.0 + options.labelBaselineShift))
               .arg(svgTextValue(*element.label));
    }
}

void writeSVGDimensions(QTextStream& out, const FloorPlanModel& model,
                        const SVGExportOptions& options, NumberWriter& n)
{
    double planWidth = model.boundingBox.width() * options.scale;
    double planHeight = model.boundingBox.height() * options.scale;

    // Width, below the plan
    double bottomY = planHeight + options.dimensionOffset;
    out << QStringLiteral("    <line class=\"dimension-line\" x1=\"0\" y1=\"%1\" x2=\"%2\" y2=\"%1\" "
                          "marker-start=\"url(#arrow)\" marker-end=\"url(#arrow)\"/>\n")
           .arg(n(bottomY)).arg(n(planWidth));
    out << QStringLiteral("    <text class=\"dimension\" x=\"%1\" y=\"%2\" text-anchor=\"middle\">%3</text>\n")
           .arg(n(planWidth / 2.0))
           .arg(n(bottomY + SVG_DIMENSION_LABEL_GAP))
           .arg(dimensionText(model.roomDimensions.width, QStringLiteral("m")));

    // Depth, right of the plan, label turned to run along the line
    double rightX = planWidth + options.dimensionOffset;
    double labelX = rightX + SVG_DEPTH_LABEL_GAP;
    double labelY = planHeight / 2.0;
    out << QStringLiteral("    <line class=\"dimension-line\" x1=\"%1\" y1=\"0\" x2=\"%1\" y2=\"%2\" "
                          "marker-start=\"url(#arrow)\" marker-end=\"url(#arrow)\"/>\n")
           .arg(n(rightX)).arg(n(planHeight));
    out << QStringLiteral("    <text class=\"dimension\" x=\"%1\" y=\"%2\" text-anchor=\"middle\" "
                          "transform=\"rotate(90, %1, %2)\">%3</text>\n")
           .arg(n(labelX)).arg(n(labelY))
           .arg(dimensionText(model.roomDimensions.depth, QStringLiteral("m")));
}

}  // anonymous namespace

QString floorPlanToSVG(
    const FloorPlanModel& model,
    bool includeDimensions,
    const SVGExportOptions& options)
{
    NumberWriter n(3);
    const QRectF& box = model.boundingBox;

    int width = canvasExtent(box.width() * options.scale + options.padding * 2.0);
    int height = canvasExtent(box.height() * options.scale + options.padding * 2.0);

    QString svg;
    QTextStream out(&svg);

    // SVG header
    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    out << QStringLiteral("<svg xmlns=\"http://www.w3.org/2000/svg\" version=\"1.1\" "
                          "width=\"%1\" height=\"%2\" viewBox=\"0 0 %1 %2\">\n")
           .arg(width).arg(height);
    out << "  <title>Floor Plan</title>\n";
    out << SVG_DEFS;

    // Plan content, shifted in by the padding
    out << QStringLiteral("  <g transform=\"translate(%1, %2)\">\n")
           .arg(n(options.padding)).arg(n(options.padding));

    for (ElementType type : DRAW_ORDER) {
        for (const FloorPlanElement& element : model.elements) {
            if (element.kind.type() == type) {
                writeSVGElement(out, element, box, options, n);
            }
        }
    }

    if (includeDimensions) {
        writeSVGDimensions(out, model, options, n);
    }

    out << "  </g>\n";
    out << "</svg>\n";
    out.flush();

    if (n.sawNonFinite()) {
        qCWarning(lcExport) << "SVG export: non-finite coordinates written as 0";
    }
    qCDebug(lcExport) << "SVG export:" << model.elements.size() << "elements,"
                      << svg.size() << "characters";
    return svg;
}

// =====================================================================
//  DXF Export
// =====================================================================

namespace {

struct DXFLayer {
    const char* name;
    int colorIndex;     ///< AutoCAD color index
};

const DXFLayer LAYER_WALLS      = {"WALLS", 7};
const DXFLayer LAYER_DOORS      = {"DOORS", 3};
const DXFLayer LAYER_WINDOWS    = {"WINDOWS", 5};
const DXFLayer LAYER_OPENINGS   = {"OPENINGS", 9};
const DXFLayer LAYER_OBJECTS    = {"OBJECTS", 8};
const DXFLayer LAYER_DIMENSIONS = {"DIMENSIONS", 1};

/// Layer an element is drawn on, or nullptr if the element type is not
/// exported to DXF with these options
const DXFLayer* dxfLayerFor(ElementType type, const DXFExportOptions& options)
{
    switch (type) {
    case ElementType::Wall:    return &LAYER_WALLS;
    case ElementType::Door:    return &LAYER_DOORS;
    case ElementType::Window:  return &LAYER_WINDOWS;
    case ElementType::Opening: return options.includeOpenings ? &LAYER_OPENINGS : nullptr;
    case ElementType::Object:  return &LAYER_OBJECTS;
    }
    return nullptr;
}

/// $INSUNITS code for a drawing-units-per-meter scale
int insertionUnits(double scale)
{
    if (qFuzzyCompare(scale, 1.0)) return 6;      // Meters
    if (qFuzzyCompare(scale, 100.0)) return 5;    // Centimeters
    if (qFuzzyCompare(scale, 1000.0)) return 4;   // Millimeters
    return 0;                                     // Unitless
}

/// TEXT values must stay on a single line
QString dxfTextValue(const QString& text)
{
    QString value = text;
    value.replace(QLatin1String("\r\n"), QLatin1String(" "));
    value.replace(QLatin1Char('\n'), QLatin1Char(' '));
    value.replace(QLatin1Char('\r'), QLatin1Char(' '));
    return value;
}

void writeDXFHeader(QTextStream& out, const DXFExportOptions& options)
{
    out << "0\nSECTION\n2\nHEADER\n";
    out << "9\n$ACADVER\n1\nAC1015\n";  // AutoCAD 2000 format
    out << "9\n$INSUNITS\n70\n" << insertionUnits(options.scale) << "\n";
    out << "0\nENDSEC\n";

    QVector<const DXFLayer*> layers = {&LAYER_WALLS, &LAYER_DOORS, &LAYER_WINDOWS};
    if (options.includeOpenings) layers.append(&LAYER_OPENINGS);
    layers << &LAYER_OBJECTS << &LAYER_DIMENSIONS;

    out << "0\nSECTION\n2\nTABLES\n";
    out << "0\nTABLE\n2\nLAYER\n70\n" << layers.size() << "\n";
    for (const DXFLayer* layer : layers) {
        out << "0\nLAYER\n2\n" << layer->name << "\n70\n0\n62\n"
            << layer->colorIndex << "\n6\nCONTINUOUS\n";
    }
    out << "0\nENDTAB\n";
    out << "0\nENDSEC\n";
}

/// Closed four-vertex LWPOLYLINE, corners (x1,y1) (x2,y1) (x2,y2) (x1,y2)
void writeDXFRectangle(QTextStream& out, const DXFLayer& layer,
                       double x1, double y1, double x2, double y2,
                       NumberWriter& n)
{
    out << "0\nLWPOLYLINE\n";
    out << "8\n" << layer.name << "\n";
    out << "90\n4\n";
    out << "70\n1\n";  // Closed polyline
    out << "10\n" << n(x1) << "\n20\n" << n(y1) << "\n";
    out << "10\n" << n(x2) << "\n20\n" << n(y1) << "\n";
    out << "10\n" << n(x2) << "\n20\n" << n(y2) << "\n";
    out << "10\n" << n(x1) << "\n20\n" << n(y2) << "\n";
}

void writeDXFText(QTextStream& out, const DXFLayer& layer,
                  double x, double y, double height, const QString& text,
                  NumberWriter& n)
{
    out << "0\nTEXT\n";
    out << "8\n" << layer.name << "\n";
    out << "10\n" << n(x) << "\n";
    out << "20\n" << n(y) << "\n";
    out << "40\n" << n(height) << "\n";  // Text height
    out << "1\n" << dxfTextValue(text) << "\n";
}

}  // anonymous namespace

QString floorPlanToDXF(
    const FloorPlanModel& model,
    bool includeDimensions,
    const DXFExportOptions& options)
{
    NumberWriter n(6);
    const QRectF& box = model.boundingBox;
    double scale = options.scale;

    QString dxf;
    QTextStream out(&dxf);

    writeDXFHeader(out, options);

    // Entities section
    out << "0\nSECTION\n2\nENTITIES\n";

    for (ElementType type : DRAW_ORDER) {
        const DXFLayer* layer = dxfLayerFor(type, options);
        if (!layer) continue;

        for (const FloorPlanElement& element : model.elements) {
            if (element.kind.type() != type) continue;

            double x1 = (element.rect.left() - box.left()) * scale;
            double y1 = (element.rect.top() - box.top()) * scale;
            double x2 = (element.rect.right() - box.left()) * scale;
            double y2 = (element.rect.bottom() - box.top()) * scale;
            writeDXFRectangle(out, *layer, x1, y1, x2, y2, n);

            if (element.kind.isObject() && element.label) {
                writeDXFText(out, LAYER_OBJECTS, (x1 + x2) / 2.0, (y1 + y2) / 2.0,
                             options.labelHeight, *element.label, n);
            }
        }
    }

    if (includeDimensions) {
        double totalWidth = box.width() * scale;
        double totalHeight = box.height() * scale;

        writeDXFText(out, LAYER_DIMENSIONS,
                     totalWidth / 2.0, -options.dimensionOffset,
                     options.dimensionTextHeight,
                     dimensionText(model.roomDimensions.width, QStringLiteral(" m")), n);
        writeDXFText(out, LAYER_DIMENSIONS,
                     totalWidth + options.dimensionOffset, totalHeight / 2.0,
                     options.dimensionTextHeight,
                     dimensionText(model.roomDimensions.depth, QStringLiteral(" m")), n);
    }

    out << "0\nENDSEC\n";
    out << "0\nEOF\n";
    out.flush();

    if (n.sawNonFinite()) {
        qCWarning(lcExport) << "DXF export: non-finite coordinates written as 0";
    }
    qCDebug(lcExport) << "DXF export:" << model.elements.size() << "elements,"
                      << dxf.size() << "characters";
    return dxf;
}

// =====================================================================
//  Format Dispatch
// =====================================================================

QString fileExtension(ExportFormat format)
{
    switch (format) {
    case ExportFormat::SVG: return QStringLiteral("svg");
    case ExportFormat::DXF: return QStringLiteral("dxf");
    }
    return QString();
}

QString formatDisplayName(ExportFormat format)
{
    switch (format) {
    case ExportFormat::SVG: return QStringLiteral("SVG (Vector Graphics)");
    case ExportFormat::DXF: return QStringLiteral("DXF (AutoCAD)");
    }
    return QString();
}

bool formatFromExtension(const QString& extension, ExportFormat* format)
{
    QString ext = extension.trimmed().toLower();
    if (ext.startsWith(QLatin1Char('.'))) ext.remove(0, 1);

    for (ExportFormat candidate : {ExportFormat::SVG, ExportFormat::DXF}) {
        if (ext == fileExtension(candidate)) {
            if (format) *format = candidate;
            return true;
        }
    }
    return false;
}

QString exportFloorPlan(
    const FloorPlanModel& model,
    ExportFormat format,
    bool includeDimensions,
    const ExportOptions& options)
{
    switch (format) {
    case ExportFormat::SVG: return floorPlanToSVG(model, includeDimensions, options.svg);
    case ExportFormat::DXF: return floorPlanToDXF(model, includeDimensions, options.dxf);
    }
    return QString();
}

QString exportFileName(ExportFormat format, const QDateTime& timestamp)
{
    return QStringLiteral("FloorPlan_%1.%2")
        .arg(timestamp.toString(QStringLiteral("yyyyMMdd_HHmmss")),
             fileExtension(format));
}

bool exportFloorPlanToFile(
    const FloorPlanModel& model,
    ExportFormat format,
    const QString& filePath,
    bool includeDimensions,
    QString* errorMsg,
    const ExportOptions& options)
{
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        if (errorMsg) *errorMsg = QStringLiteral("Failed to open %1 for writing: %2")
                                      .arg(filePath, file.errorString());
        qCWarning(lcExport) << "Cannot write" << filePath << file.errorString();
        return false;
    }

    QByteArray content = exportFloorPlan(model, format, includeDimensions, options).toUtf8();
    if (file.write(content) != content.size()) {
        if (errorMsg) *errorMsg = QStringLiteral("Failed to write %1: %2")
                                      .arg(filePath, file.errorString());
        qCWarning(lcExport) << "Short write to" << filePath << file.errorString();
        return false;
    }
    if (!file.flush()) {
        if (errorMsg) *errorMsg = QStringLiteral("Failed to write %1: %2")
                                      .arg(filePath, file.errorString());
        qCWarning(lcExport) << "Flush failed for" << filePath << file.errorString();
        return false;
    }

    return true;
}

}  // namespace plan
}  // namespace floorplan
