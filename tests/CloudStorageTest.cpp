#include <gtest/gtest.h>
#include <Services/CloudStorage.h>

#include <QFile>
#include <QTemporaryDir>
#include <QUrlQuery>

namespace
{
    AppConfig configWith(bool s3, bool firebase)
    {
        AppConfig cfg;
        cfg.aws.bucket = "med-scans";
        cfg.aws.region = "eu-central-1";
        cfg.firebase.storageBucket = "viewer.appspot.com";
        if (s3)
        {
            cfg.aws.accessKeyId = "AKIDEXAMPLE";
            cfg.aws.secretAccessKey = "secret";
        }
        if (firebase)
            cfg.firebase.accessToken = "ya29.token";
        return cfg;
    }
}

TEST(CloudStorage, AvailabilityFollowsCredentials)
{
    CloudStorage none(configWith(false, false));
    QString err;
    EXPECT_FALSE(none.s3Available());
    EXPECT_FALSE(none.firebaseAvailable());
    EXPECT_FALSE(none.initialize(&err));
    EXPECT_FALSE(err.isEmpty());

    CloudStorage s3(configWith(true, false));
    EXPECT_TRUE(s3.s3Available());
    EXPECT_FALSE(s3.firebaseAvailable());
    EXPECT_TRUE(s3.initialize(&err));

    CloudStorage fb(configWith(false, true));
    EXPECT_TRUE(fb.firebaseAvailable());
    EXPECT_TRUE(fb.initialize(&err));
}

TEST(CloudStorage, S3Urls)
{
    CloudStorage cs(configWith(true, false));
    EXPECT_EQ(cs.s3PublicUrl("ct.nii.gz"), "https://med-scans.s3.amazonaws.com/ct.nii.gz");
    EXPECT_EQ(cs.s3RequestUrl("ct.nii.gz").toString(), "https://med-scans.s3.eu-central-1.amazonaws.com/ct.nii.gz");

    AppConfig local = configWith(true, false);
    local.aws.endpoint = "http://localhost:9000/";
    CloudStorage minio(local);
    EXPECT_EQ(minio.s3PublicUrl("a.stl"), "http://localhost:9000/med-scans/a.stl");
    EXPECT_EQ(minio.s3RequestUrl("a.stl").toString(), "http://localhost:9000/med-scans/a.stl");
}

TEST(CloudStorage, FirebaseUrls)
{
    CloudStorage cs(configWith(false, true));
    EXPECT_EQ(cs.firebasePublicUrl("heart.stl"), "https://storage.googleapis.com/viewer.appspot.com/heart.stl");
    const QUrl up = cs.firebaseUploadUrl("scans/heart 1.stl");
    EXPECT_EQ(up.host(), "firebasestorage.googleapis.com");
    EXPECT_EQ(up.path(), "/v0/b/viewer.appspot.com/o");
    const QUrlQuery q(up);
    EXPECT_EQ(q.queryItemValue("uploadType"), "media");
    EXPECT_EQ(q.queryItemValue("name", QUrl::FullyDecoded), "scans/heart 1.stl");

    EXPECT_EQ(cs.firebaseObjectUrl("scans/heart.stl").toString(QUrl::FullyEncoded),
        "https://firebasestorage.googleapis.com/v0/b/viewer.appspot.com/o/scans%2Fheart.stl");
}

TEST(CloudStorage, UploadErrorsWithoutNetwork)
{
    QTemporaryDir dir;
    const QString file = dir.filePath("model.stl");
    {
        QFile f(file);
        ASSERT_TRUE(f.open(QIODevice::WriteOnly));
        f.write("solid x\nendsolid x\n");
    }

    CloudStorage none(configWith(false, false));
    QString err;
    EXPECT_TRUE(none.uploadToS3(dir.filePath("missing.stl"), QString(), &err).isEmpty());
    EXPECT_TRUE(err.startsWith("File not found"));

    EXPECT_TRUE(none.uploadToS3(file, QString(), &err).isEmpty());
    EXPECT_EQ(err, "AWS credentials not configured (set AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY)");

    EXPECT_TRUE(none.uploadToFirebase(file, QString(), &err).isEmpty());
    EXPECT_EQ(err, "Firebase credentials not configured (set FIREBASE_ACCESS_TOKEN)");

    CloudStorage s3(configWith(true, true));
    EXPECT_FALSE(s3.deleteFromS3(QString(), &err));
    EXPECT_EQ(err, "Object name is empty");
    EXPECT_FALSE(s3.deleteFromFirebase(QString(), &err));
    EXPECT_EQ(err, "Object name is empty");
}
