#pragma once

#include "gateStep.hpp"

#include <QImage>
#include <QMainWindow>
#include <QWidget>

#include <opencv2/core/mat.hpp>

#include <functional>

class QComboBox;
class QLabel;

namespace facegate {

class CvMatrixView : public QWidget {
public:
	explicit CvMatrixView(QWidget* parent = nullptr);
	void setMat(const cv::Mat& mat);

protected:
	void paintEvent(QPaintEvent* event) override;

private:
	static QImage matToQImage(const cv::Mat& mat);

	QImage m_image{};
};


class MainWindow : public QMainWindow {
public:
	enum class Source { Image, Webcam };

public:
	explicit MainWindow(QWidget* parent = nullptr);
	~MainWindow() override;

	void setImage(const cv::Mat& image);
	void setVerdict(const QString& verdict);

	void setGateStepChangedCallback(std::function<void(GateStep)> callback);
	void setSourceChangedCallback(std::function<void(Source)> callback);
	GateStep selectedGateStep() const;

private:
	void buildLayout();

private:
	CvMatrixView* m_matrixView{nullptr};
	QLabel* m_verdictLabel{nullptr};
	QComboBox* m_sourceCombo{nullptr};
	QComboBox* m_stepCombo{nullptr};
	std::function<void(GateStep)> m_stepChangedCallback{};
	std::function<void(Source)> m_sourceChangedCallback{};
};

} // namespace facegate
