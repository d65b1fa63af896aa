#pragma once

// ============================================================================
// PathStore - Ordered collection of completed paths for one surface
// ============================================================================
// Insertion order is chronological draw order and visual paint order.
// PathStore is a pure data class - it does not paint or persist. The
// SurfaceController requests a full replay after undo/clear/load.
// ============================================================================

#include "../strokes/InkPath.h"

#include <QVector>
#include <QByteArray>
#include <QJsonArray>

class PathStore {
public:
    PathStore() = default;

    // ===== Mutation =====

    /**
     * @brief Append a completed path.
     * @param path The path to add.
     * @return False if the path has fewer than 2 points (not stored).
     */
    bool append(const InkPath& path);

    /**
     * @brief Append a completed path by moving it.
     */
    bool append(InkPath&& path);

    /**
     * @brief Remove the most recently appended path.
     * @return False if the store was already empty (no-op).
     */
    bool undo();

    /**
     * @brief Remove all paths.
     */
    void clear() { m_paths.clear(); }

    /**
     * @brief Replace the contents wholesale.
     *
     * Paths with fewer than 2 points are dropped.
     */
    void load(const QVector<InkPath>& paths);

    // ===== Access =====

    const QVector<InkPath>& paths() const { return m_paths; }
    int count() const { return m_paths.size(); }
    bool isEmpty() const { return m_paths.isEmpty(); }
    const InkPath& last() const { return m_paths.last(); }

    // ===== Serialization =====

    /**
     * @brief Serialize as a JSON array of paths.
     */
    QJsonArray toJson() const;

    /**
     * @brief Compact JSON text of the path sequence.
     *
     * An empty store serializes to "[]", which is distinct from an absent
     * record.
     */
    QByteArray serialize() const;

    /**
     * @brief Parse the output of serialize().
     * @param data Serialized path sequence.
     * @param paths Receives the parsed paths on success.
     * @return False if the data is unparsable or any element is structurally
     *         invalid; paths is left empty in that case.
     */
    static bool deserialize(const QByteArray& data, QVector<InkPath>& paths);

    /**
     * @brief Parse a JSON array of paths (see deserialize()).
     */
    static bool fromJson(const QJsonArray& array, QVector<InkPath>& paths);

private:
    QVector<InkPath> m_paths;
};
