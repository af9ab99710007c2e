// PCA via covariance eigen-decomposition.

#include "embedding/pca_projection.h"

#include <algorithm>
#include <cmath>

#include <Eigen/Eigenvalues>

#include "core/basic_types.h"

namespace moodspace {

PcaResult computePca(const Matrix& data, size_t n_components) {
  PcaResult result;
  const Eigen::Index rows = data.rows();
  const Eigen::Index cols = data.cols();
  size_t keep = std::min({n_components, static_cast<size_t>(rows), static_cast<size_t>(cols)});
  if (keep == 0) {
    result.projected = Matrix::Zero(rows, 0);
    result.success = rows > 0 && cols > 0;
    return result;
  }

  Matrix centered = data.rowwise() - data.colwise().mean();
  double divisor = rows > 1 ? static_cast<double>(rows - 1) : 1.0;
  Matrix covariance = (centered.transpose() * centered) / divisor;

  Eigen::SelfAdjointEigenSolver<Matrix> solver(covariance);
  if (solver.info() != Eigen::Success) {
    return result;
  }

  // Eigenvalues come back ascending; walk from the top.
  const Eigen::VectorXd& values = solver.eigenvalues();
  const Matrix& vectors = solver.eigenvectors();
  double total_variance = 0.0;
  for (Eigen::Index idx = 0; idx < values.size(); ++idx) {
    total_variance += std::max(0.0, values(idx));
  }

  Matrix components(cols, static_cast<Eigen::Index>(keep));
  for (size_t comp = 0; comp < keep; ++comp) {
    Eigen::Index src = values.size() - 1 - static_cast<Eigen::Index>(comp);
    Eigen::VectorXd axis = vectors.col(src);
    Eigen::Index pivot = 0;
    axis.cwiseAbs().maxCoeff(&pivot);
    if (axis(pivot) < 0.0) axis = -axis;
    components.col(static_cast<Eigen::Index>(comp)) = axis;

    double variance = std::max(0.0, values(src));
    result.explained_variance_ratio.push_back(
        total_variance > 0.0 ? variance / total_variance : 0.0);
  }

  result.projected = centered * components;
  result.success = result.projected.allFinite();
  return result;
}

Matrix PcaProjection::embed(const Matrix& data) const {
  Matrix positions = Matrix::Zero(data.rows(), static_cast<Eigen::Index>(kPositionDims));
  PcaResult pca = computePca(data, kPositionDims);
  if (!pca.success) return positions;
  positions.leftCols(pca.projected.cols()) = pca.projected;
  return positions;
}

}  // namespace moodspace
